/*##############################################################################

    HPCC SYSTEMS software Copyright (C) 2026 HPCC Systems®.

    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
############################################################################## */

#include "platform.h"

#include "dcplus.hpp"
#include "dcerror.hpp"
#include "dcconfig.hpp"
#include "dcplan.hpp"
#include "dctransfer.hpp"
#include "dcexec.hpp"
#include "dcprogress.hpp"

CDistCopyHelper::CDistCopyHelper(IProperties * _globals)
{
    globals.setown(_globals);
}

int CDistCopyHelper::doit()
{
    const char* action = globals->queryProp("action");
    if (action == nullptr || *action == '\0')
        throwDcError1(DCERR_TooFewArguments, "an action");
    return distribute(getDistributionMode(action));
}

IPropertyTree * CDistCopyHelper::createOptions()
{
    Owned<IPropertyTree> options = createPTree("DistCopyOptions");

    const char * connections = globals->queryProp("maxconnections");
    if (connections && *connections)
    {
        char * end = nullptr;
        long value = strtol(connections, &end, 10);
        if (*end || (value < 0))
            throwDcError2(DCERR_InvalidArgument, connections, "maxconnections");
        options->setPropInt("@maxConnections", (int)value);
    }
    options->setPropBool("@dryRun", globals->getPropBool("dryrun", false));
    if (globals->hasProp("ssh"))
        options->setProp("@sshCommand", globals->queryProp("ssh"));
    if (globals->hasProp("rsync"))
        options->setProp("@rsyncCommand", globals->queryProp("rsync"));
    return options.getClear();
}

int CDistCopyHelper::distribute(DistributionMode mode)
{
    const char * configName = globals->queryProp("config");
    if (configName == nullptr || *configName == '\0')
        throwDcError1(DCERR_TooFewArguments, "the distribution config (config=<csv>)");

    Owned<IPropertyTree> options = createOptions();

    DistributionConfig config;
    config.loadCsvFile(configName);
    info("Loaded %u sources and %u destinations from %s\n", config.numSources(), config.numDestinations(), configName);

    Owned<IContentInspector> inspector = createShellContentInspector(options);
    TransferPlan plan;
    compilePlan(plan, mode, config, *inspector);
    plan.display();

    const char * planName = globals->queryProp("saveplan");
    if (planName && *planName)
        savePlan(plan, planName);

    if (options->getPropBool("@dryRun"))
    {
        info("Dry run: %s plan has %u rounds and %u transfers, nothing copied\n", queryDistributionModeText(mode), plan.numRounds(), plan.numEdges());
        return 0;
    }

    Owned<ITransferAgent> agent = createShellTransferAgent(options);
    LogPlanProgress progress;
    try
    {
        executePlan(plan, *agent, options, &progress);
    }
    catch (IMultiException * me)
    {
        exc(*me, queryDistributionModeText(mode));
        throw;
    }
    info("%s completed: %u transfers in %u rounds\n", queryDistributionModeText(mode), progress.queryEdgesDone(), plan.numRounds());
    return 0;
}

void CDistCopyHelper::exc(const IMultiException& excep, const char *title)
{
    error("%s failed:\n", title);
    aindex_t count = excep.ordinality();
    for (aindex_t i=0; i<count; i++)
    {
        IException & e = excep.item(i);
        StringBuffer msg;
        error("%d: %s\n", e.errorCode(), e.errorMessage(msg).str());
    }
}

void CDistCopyHelper::info(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    StringBuffer buf;
    buf.valist_appendf(fmt,args);
    va_end(args);
    printf("%s",buf.str());
}

void CDistCopyHelper::error(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    StringBuffer buf;
    buf.valist_appendf(fmt,args);
    va_end(args);
    fprintf(stderr, "%s",buf.str());
}
