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

#ifndef DCPLAN_HPP
#define DCPLAN_HPP

#include <vector>

#include "jptree.hpp"
#include "distcopy.hpp"
#include "dcconfig.hpp"
#include "dcrange.hpp"

//One copy operation.  The selection says which part of the source is read.
struct DISTCOPY_API TransferEdge
{
public:
    TransferEdge() = default;
    TransferEdge(const Holding & _from, const Holding & _to) : from(_from), to(_to) {}

    StringBuffer & describe(StringBuffer & out) const;
    bool isSelfCopy() const             { return from.sameLocation(to); }

public:
    Holding             from;
    Holding             to;
    ContentSelection    selection;
    unsigned            chunk = 0;          // position within an ordered gather
    bool                append = false;     // gather chunks after the first are appended to the target
};

//Edges that can all run at once.  When orderedWrites is set the edges share one target file,
//and their writes must be applied in edge order.
struct DISTCOPY_API TransferRound
{
public:
    unsigned numEdges() const           { return (unsigned)edges.size(); }

public:
    std::vector<TransferEdge>   edges;
    bool                        orderedWrites = false;
};

class DISTCOPY_API TransferPlan
{
public:
    TransferPlan(DistributionMode _mode = DMbroadcast) : mode(_mode) {}

    TransferRound & addRound();
    void clear(DistributionMode _mode);
    void display() const;
    unsigned numEdges() const;
    IPropertyTree * createTree() const;
    void setKind(ContentKind _kind)     { kind = _kind; }

    ContentKind queryKind() const       { return kind; }
    DistributionMode queryMode() const  { return mode; }
    unsigned numRounds() const          { return (unsigned)rounds.size(); }
    const TransferRound & queryRound(unsigned idx) const { return rounds[idx]; }
    const std::vector<TransferRound> & queryRounds() const { return rounds; }

protected:
    std::vector<TransferRound> rounds;
    DistributionMode mode;
    ContentKind kind = CKunknown;
};

extern DISTCOPY_API void planBroadcast(TransferPlan & plan, const DistributionConfig & config);
extern DISTCOPY_API void planScatter(TransferPlan & plan, const DistributionConfig & config, IContentInspector & inspector);
extern DISTCOPY_API void planGather(TransferPlan & plan, const DistributionConfig & config, IContentInspector & inspector);

//Validates the config for the mode and builds the plan.  Nothing is transferred.
extern DISTCOPY_API void compilePlan(TransferPlan & plan, DistributionMode mode, const DistributionConfig & config, IContentInspector & inspector);
extern DISTCOPY_API void savePlan(const TransferPlan & plan, const char * filename);

#endif
