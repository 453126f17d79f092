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
#include <algorithm>
#include "jlib.hpp"
#include "jlog.hpp"

#include "dcerror.hpp"
#include "dcplan.hpp"

//Each round every holding that already has the data copies it to one more destination, so the
//number of usable sources doubles every round.  Destinations are served strictly in declared order.
void planBroadcast(TransferPlan & plan, const DistributionConfig & config)
{
    LOG(MCdebugProgressDetail, "Setting up broadcast plan");
    const std::vector<Holding> & destinations = config.queryDestinations();

    //Ranges play no part in a broadcast - everything copies whole
    std::vector<Holding> available;
    for (const Holding & cur : config.querySources())
        available.emplace_back(cur.node.c_str(), cur.path.c_str());

    size_t nextDestination = 0;
    while (nextDestination < destinations.size())
    {
        size_t numAvailable = available.size();
        size_t numTaken = std::min(numAvailable, destinations.size() - nextDestination);

        std::vector<TransferEdge> edges;
        for (size_t i = 0; i < numTaken; i++)
        {
            const Holding & dest = destinations[nextDestination + i];
            TransferEdge edge(available[i % numAvailable], Holding(dest.node.c_str(), dest.path.c_str()));
            if (edge.isSelfCopy())
            {
                StringBuffer s;
                LOG(MCdebugInfo, "Skipping copy of %s onto itself", dest.describe(s).str());
                continue;
            }
            edges.push_back(edge);
        }

        //A served destination is a source for every following round
        for (size_t i = 0; i < numTaken; i++)
        {
            const Holding & dest = destinations[nextDestination + i];
            available.emplace_back(dest.node.c_str(), dest.path.c_str());
        }
        nextDestination += numTaken;

        if (!edges.empty())
            plan.addRound().edges.swap(edges);
    }
}
