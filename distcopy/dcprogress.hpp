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

#ifndef DCPROGRESS_HPP
#define DCPROGRESS_HPP

#include "jmutex.hpp"
#include "distcopy.hpp"
#include "dcexec.hpp"


class DISTCOPY_API DistCopyProgress : public IPlanProgress
{
public:
    DistCopyProgress();

    virtual void onPlanStart(unsigned numRounds, unsigned numEdges) override;
    virtual void onRoundStart(unsigned round, unsigned numEdges) override;
    virtual void onEdgeDone(unsigned round, unsigned edge, bool ok) override;
    virtual void onRoundDone(unsigned round, unsigned numFailed) override;
    virtual void onPlanDone() override;

    virtual void displayProgress(unsigned round, unsigned edgesDone, unsigned edgesFailed, unsigned roundEdges, unsigned totalDone, unsigned totalEdges) = 0;
    virtual void displayRound(unsigned round, unsigned numFailed, const char * timeTaken) = 0;
    virtual void displaySummary(unsigned numRounds, unsigned numEdges, const char * timeTaken) = 0;

    unsigned queryEdgesDone() const     { return totalDone; }
    unsigned queryEdgesFailed() const   { return totalFailed; }

protected:
    void formatTime(StringBuffer & out, unsigned secs);

protected:
    CriticalSection crit;
    unsigned startTime = 0;
    unsigned roundStartTime = 0;
    unsigned totalRounds = 0;
    unsigned totalEdges = 0;
    unsigned totalDone = 0;
    unsigned totalFailed = 0;
    unsigned roundEdges = 0;
    unsigned roundDone = 0;
    unsigned roundFailed = 0;
};


class DISTCOPY_API LogPlanProgress : public DistCopyProgress
{
public:
    virtual void displayProgress(unsigned round, unsigned edgesDone, unsigned edgesFailed, unsigned roundEdges, unsigned totalDone, unsigned totalEdges) override;
    virtual void displayRound(unsigned round, unsigned numFailed, const char * timeTaken) override;
    virtual void displaySummary(unsigned numRounds, unsigned numEdges, const char * timeTaken) override;
};

#endif
