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

#include "jliball.hpp"

#include "platform.h"
#include "jlib.hpp"
#include "jlog.hpp"
#include "jptree.hpp"

#include "dcerror.hpp"
#include "dcplan.hpp"

//Use hash defines for properties so I can't mis-spell them....
#define ANappend            "@append"
#define ANchunk             "@chunk"
#define ANedges             "@edges"
#define ANfrom              "@from"
#define ANindex             "@index"
#define ANkind              "@kind"
#define ANmode              "@mode"
#define ANnode              "@node"
#define ANorderedWrites     "@orderedWrites"
#define ANpath              "@path"
#define ANrounds            "@rounds"
#define ANselection         "@selection"
#define ANto                "@to"

#define PNplan              "DistCopyPlan"
#define PNround             "Round"
#define PNedge              "Edge"
#define PNsource            "Source"
#define PNtarget            "Target"

static const char * DMtext[DMlast] = { "broadcast", "scatter", "gather" };

DistributionMode getDistributionMode(const char * name)
{
    for (unsigned i = 0; i < DMlast; i++)
    {
        if (name && (stricmp(name, DMtext[i]) == 0))
            return (DistributionMode)i;
    }
    throwDcError1(DCERR_UnknownMode, name ? name : "");
}

const char * queryDistributionModeText(DistributionMode mode)
{
    if ((unsigned)mode < DMlast)
        return DMtext[mode];
    return "unknown";
}

const char * queryContentKindText(ContentKind kind)
{
    switch (kind)
    {
    case CKfile:
        return "file";
    case CKfolder:
        return "folder";
    default:
        break;
    }
    return "unknown";
}

//----------------------------------------------------------------------------

StringBuffer & TransferEdge::describe(StringBuffer & out) const
{
    from.describe(out).append(" -> ");
    to.describe(out);
    if (!selection.whole)
        selection.describe(out.append(" {")).append('}');
    if (append)
        out.appendf(" (append chunk %u)", chunk);
    return out;
}

//----------------------------------------------------------------------------

TransferRound & TransferPlan::addRound()
{
    rounds.emplace_back();
    return rounds.back();
}

void TransferPlan::clear(DistributionMode _mode)
{
    rounds.clear();
    mode = _mode;
    kind = CKunknown;
}

unsigned TransferPlan::numEdges() const
{
    unsigned total = 0;
    for (const TransferRound & round : rounds)
        total += round.numEdges();
    return total;
}

void TransferPlan::display() const
{
    LOG(MCdebugProgress, "%s plan (%s): %u rounds, %u transfers", queryDistributionModeText(mode), queryContentKindText(kind), numRounds(), numEdges());
    for (unsigned idx = 0; idx < rounds.size(); idx++)
    {
        const TransferRound & round = rounds[idx];
        LOG(MCdebugProgress, "Round %u%s:", idx, round.orderedWrites ? " (ordered writes)" : "");
        for (const TransferEdge & edge : round.edges)
        {
            StringBuffer s;
            LOG(MCdebugProgress, "    %s", edge.describe(s).str());
        }
    }
}

static void saveHolding(IPropertyTree * tree, const Holding & holding)
{
    tree->setProp(ANnode, holding.node.c_str());
    tree->setProp(ANpath, holding.path.c_str());
    if (holding.hasRange)
    {
        tree->setPropInt64(ANfrom, holding.from);
        tree->setPropInt64(ANto, holding.to);
    }
}

IPropertyTree * TransferPlan::createTree() const
{
    Owned<IPropertyTree> tree = createPTree(PNplan);
    tree->setProp(ANmode, queryDistributionModeText(mode));
    tree->setProp(ANkind, queryContentKindText(kind));
    tree->setPropInt(ANrounds, numRounds());
    tree->setPropInt(ANedges, numEdges());
    for (unsigned idx = 0; idx < rounds.size(); idx++)
    {
        const TransferRound & round = rounds[idx];
        IPropertyTree * roundTree = tree->addPropTree(PNround, createPTree(PNround));
        roundTree->setPropInt(ANindex, idx);
        roundTree->setPropBool(ANorderedWrites, round.orderedWrites);
        for (const TransferEdge & edge : round.edges)
        {
            IPropertyTree * edgeTree = roundTree->addPropTree(PNedge, createPTree(PNedge));
            saveHolding(edgeTree->addPropTree(PNsource, createPTree(PNsource)), edge.from);
            saveHolding(edgeTree->addPropTree(PNtarget, createPTree(PNtarget)), edge.to);
            StringBuffer s;
            edgeTree->setProp(ANselection, edge.selection.describe(s).str());
            if (round.orderedWrites)
            {
                edgeTree->setPropInt(ANchunk, edge.chunk);
                edgeTree->setPropBool(ANappend, edge.append);
            }
        }
    }
    return tree.getClear();
}

void savePlan(const TransferPlan & plan, const char * filename)
{
    Owned<IPropertyTree> tree = plan.createTree();
    saveXML(filename, tree);
    PROGLOG("Saved %s plan to %s", queryDistributionModeText(plan.queryMode()), filename);
}

//----------------------------------------------------------------------------

void compilePlan(TransferPlan & plan, DistributionMode mode, const DistributionConfig & config, IContentInspector & inspector)
{
    config.validate(mode);
    plan.clear(mode);
    switch (mode)
    {
    case DMbroadcast:
        planBroadcast(plan, config);
        break;
    case DMscatter:
        planScatter(plan, config, inspector);
        break;
    case DMgather:
        planGather(plan, config, inspector);
        break;
    default:
        throwDcError1(DCERR_UnknownMode, queryDistributionModeText(mode));
    }
    LOG(MCdebugInfo, "Compiled %s plan: %u rounds, %u transfers", queryDistributionModeText(mode), plan.numRounds(), plan.numEdges());
}
