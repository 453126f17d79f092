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
#include <atomic>
#include "jlib.hpp"
#include "jlog.hpp"
#include "jmutex.hpp"
#include "jthread.hpp"

#include "dcerror.hpp"
#include "dcexec.hpp"

class TransferRoundRunner : public CAsyncFor
{
public:
    TransferRoundRunner(unsigned _roundIdx, const TransferRound & _round, ITransferAgent & _agent, IPlanProgress * _progress)
        : roundIdx(_roundIdx), round(_round), agent(_agent), progress(_progress), copied(_round.edges.size(), false)
    {
        failures.setown(MakeMultiException("executePlan"));
    }

    virtual void Do(unsigned idx)
    {
        if (aborted)
        {
            ++numSkipped;
            return;
        }

        const TransferEdge & edge = round.edges[idx];
        StringBuffer targetPath;
        queryTargetPath(targetPath, edge);
        try
        {
            agent.copy(edge, targetPath.str());
            {
                CriticalBlock block(crit);
                copied[idx] = true;
            }
            if (progress)
                progress->onEdgeDone(roundIdx, idx, true);
        }
        catch (IException * e)
        {
            StringBuffer msg, s1, s2;
            e->errorMessage(msg);
            e->Release();
            aborted = true;
            Owned<IException> error = MakeStringException(DCERR_CopyFailed, DCERR_CopyFailed_Text, roundIdx, idx,
                                                         edge.from.describe(s1).str(), edge.to.describe(s2).str(), msg.str());
            EXCLOG(error, nullptr);
            {
                CriticalBlock block(crit);
                failures->append(*error.getClear());
            }
            if (progress)
                progress->onEdgeDone(roundIdx, idx, false);
        }
    }

    void run(unsigned maxConnections)
    {
        unsigned numEdges = round.numEdges();
        if (!numEdges)
            return;
        unsigned maxAtOnce = (maxConnections && (maxConnections < numEdges)) ? maxConnections : numEdges;
        For(numEdges, maxAtOnce, false, false);
        if (numSkipped)
            LOG(MCdebugInfo, "Round %u: %u transfers skipped after a failure", roundIdx, (unsigned)numSkipped);
    }

    //Writes to a shared target are committed in edge order once every chunk has been staged
    void commitStaged()
    {
        unsigned numEdges = round.numEdges();
        for (unsigned idx = 0; idx < numEdges; idx++)
        {
            const TransferEdge & edge = round.edges[idx];
            StringBuffer staged;
            getStagingName(staged, edge.to, edge.chunk);
            try
            {
                agent.commit(edge.to, staged.str(), edge.append);
                copied[idx] = false;
            }
            catch (IException * e)
            {
                StringBuffer msg, s;
                e->errorMessage(msg);
                e->Release();
                Owned<IException> error = MakeStringException(DCERR_CommitFailed, DCERR_CommitFailed_Text, roundIdx, idx, edge.to.describe(s).str(), msg.str());
                EXCLOG(error, nullptr);
                failures->append(*error.getClear());
                return;
            }
        }
    }

    void removeStaged()
    {
        unsigned numEdges = round.numEdges();
        for (unsigned idx = 0; idx < numEdges; idx++)
        {
            if (!copied[idx])
                continue;
            const TransferEdge & edge = round.edges[idx];
            StringBuffer staged;
            getStagingName(staged, edge.to, edge.chunk);
            try
            {
                agent.remove(edge.to.node.c_str(), staged.str());
            }
            catch (IException * e)
            {
                VStringBuffer msg("Could not remove staged chunk %s:%s", edge.to.node.c_str(), staged.str());
                OWARNLOG(e, msg.str());
                e->Release();
            }
            copied[idx] = false;
        }
    }

    bool hasFailed() const              { return failures->ordinality() != 0; }
    unsigned numFailed() const          { return failures->ordinality(); }
    IMultiException * getFailures()     { return failures.getClear(); }

protected:
    void queryTargetPath(StringBuffer & out, const TransferEdge & edge) const
    {
        if (round.orderedWrites)
            getStagingName(out, edge.to, edge.chunk);
        else
            out.append(edge.to.path.c_str());
    }

protected:
    unsigned roundIdx;
    const TransferRound & round;
    ITransferAgent & agent;
    IPlanProgress * progress;
    CriticalSection crit;
    std::vector<bool> copied;
    Owned<IMultiException> failures;
    std::atomic<bool> aborted{false};
    std::atomic<unsigned> numSkipped{0};
};


void executePlan(const TransferPlan & plan, ITransferAgent & agent, IPropertyTree * options, IPlanProgress * progress)
{
    unsigned maxConnections = options ? options->getPropInt("@maxConnections", 0) : 0;
    if (progress)
        progress->onPlanStart(plan.numRounds(), plan.numEdges());

    for (unsigned idx = 0; idx < plan.numRounds(); idx++)
    {
        const TransferRound & round = plan.queryRound(idx);
        if (progress)
            progress->onRoundStart(idx, round.numEdges());

        TransferRoundRunner runner(idx, round, agent, progress);
        runner.run(maxConnections);
        if (round.orderedWrites && !runner.hasFailed())
            runner.commitStaged();
        if (round.orderedWrites)
            runner.removeStaged();

        if (progress)
            progress->onRoundDone(idx, runner.numFailed());
        if (runner.hasFailed())
        {
            OERRLOG(DCERR_RoundFailed_Text, idx, runner.numFailed(), round.numEdges());
            throw runner.getFailures();
        }
    }

    if (progress)
        progress->onPlanDone();
}
