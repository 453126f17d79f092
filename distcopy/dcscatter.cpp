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

#include "dcerror.hpp"
#include "dcplan.hpp"

//Destination i reads its slice from source i % numSources, so redundant sources share the load.
//All the reads are independent, so the whole scatter is a single round.
void planScatter(TransferPlan & plan, const DistributionConfig & config, IContentInspector & inspector)
{
    LOG(MCdebugProgressDetail, "Setting up scatter plan");
    const std::vector<Holding> & sources = config.querySources();
    const std::vector<Holding> & destinations = config.queryDestinations();

    std::vector<ContentExtent> extents(sources.size());
    for (unsigned idx = 0; idx < sources.size(); idx++)
    {
        resolveExtent(extents[idx], inspector, sources[idx]);
        if (extents[idx].kind != extents[0].kind)
        {
            StringBuffer s1, s2;
            throwDcError4(DCERR_MixedSourceKinds, sources[idx].describe(s1).str(), queryContentKindText(extents[idx].kind),
                          sources[0].describe(s2).str(), queryContentKindText(extents[0].kind));
        }
    }
    plan.setKind(extents[0].kind);

    std::vector<TransferEdge> edges;
    for (unsigned idx = 0; idx < destinations.size(); idx++)
    {
        unsigned whichSource = idx % (unsigned)sources.size();
        const Holding & source = sources[whichSource];
        const Holding & dest = destinations[idx];

        TransferEdge edge(Holding(source.node.c_str(), source.path.c_str()), dest);
        resolveSelection(edge.selection, extents[whichSource], edge.from, dest);
        if (edge.isSelfCopy())
        {
            StringBuffer s;
            LOG(MCdebugInfo, "Skipping copy of %s onto itself", dest.describe(s).str());
            continue;
        }
        edges.push_back(edge);
    }

    if (!edges.empty())
        plan.addRound().edges.swap(edges);
}
