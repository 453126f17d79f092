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

#ifndef DCEXEC_HPP
#define DCEXEC_HPP

#include "jptree.hpp"
#include "distcopy.hpp"
#include "dcplan.hpp"
#include "dctransfer.hpp"

//Callbacks made while a plan executes.  onEdgeDone is called from the transfer threads.
interface IPlanProgress
{
    virtual void onPlanStart(unsigned numRounds, unsigned numEdges) = 0;
    virtual void onRoundStart(unsigned round, unsigned numEdges) = 0;
    virtual void onEdgeDone(unsigned round, unsigned edge, bool ok) = 0;
    virtual void onRoundDone(unsigned round, unsigned numFailed) = 0;
    virtual void onPlanDone() = 0;
};

//Runs the rounds in order.  The edges of a round run concurrently (at most @maxConnections at once),
//and the next round only starts once every edge of the current one has finished.  If any edge fails
//the edges not yet started are skipped, and the failures are thrown as an IMultiException.
extern DISTCOPY_API void executePlan(const TransferPlan & plan, ITransferAgent & agent, IPropertyTree * options, IPlanProgress * progress = nullptr);

#endif
