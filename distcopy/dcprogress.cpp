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
#include "jtime.hpp"

#include "dcprogress.hpp"

DistCopyProgress::DistCopyProgress()
{
    startTime = msTick();
    roundStartTime = startTime;
}

void DistCopyProgress::formatTime(StringBuffer & out, unsigned secs)
{
    if (secs >= 5400)
        out.appendf("%d:%02d:%02d", secs/3600, (secs%3600)/60, secs%60);
    else if (secs >= 120)
        out.appendf("%dm %ds", secs/60, secs%60);
    else
        out.appendf("%d secs", secs);
}

void DistCopyProgress::onPlanStart(unsigned numRounds, unsigned numEdges)
{
    CriticalBlock block(crit);
    startTime = msTick();
    totalRounds = numRounds;
    totalEdges = numEdges;
    totalDone = 0;
    totalFailed = 0;
}

void DistCopyProgress::onRoundStart(unsigned round, unsigned numEdges)
{
    CriticalBlock block(crit);
    roundStartTime = msTick();
    roundEdges = numEdges;
    roundDone = 0;
    roundFailed = 0;
}

void DistCopyProgress::onEdgeDone(unsigned round, unsigned edge, bool ok)
{
    CriticalBlock block(crit);
    if (ok)
    {
        roundDone++;
        totalDone++;
    }
    else
    {
        roundFailed++;
        totalFailed++;
    }
    displayProgress(round, roundDone, roundFailed, roundEdges, totalDone, totalEdges);
}

void DistCopyProgress::onRoundDone(unsigned round, unsigned numFailed)
{
    CriticalBlock block(crit);
    StringBuffer timeTaken;
    formatTime(timeTaken, (msTick() - roundStartTime) / 1000);
    displayRound(round, numFailed, timeTaken.str());
}

void DistCopyProgress::onPlanDone()
{
    CriticalBlock block(crit);
    StringBuffer timeTaken;
    formatTime(timeTaken, (msTick() - startTime) / 1000);
    displaySummary(totalRounds, totalDone, timeTaken.str());
}

//---------------------------------------------------------------------------

void LogPlanProgress::displayProgress(unsigned round, unsigned edgesDone, unsigned edgesFailed, unsigned roundEdges, unsigned totalDone, unsigned totalEdges)
{
    LOG(MCdebugProgress, "Progress: round %u %u/%u done (%u failed), %u/%u overall", round, edgesDone, roundEdges, edgesFailed, totalDone, totalEdges);
}

void LogPlanProgress::displayRound(unsigned round, unsigned numFailed, const char * timeTaken)
{
    if (numFailed)
        LOG(MCdebugProgress, "Round %u finished with %u failures after %s", round, numFailed, timeTaken);
    else
        LOG(MCdebugProgress, "Round %u finished in %s", round, timeTaken);
}

void LogPlanProgress::displaySummary(unsigned numRounds, unsigned numEdges, const char * timeTaken)
{
    LOG(MCdebugProgress, "Summary: %u transfers in %u rounds, total time taken %s", numEdges, numRounds, timeTaken);
}
