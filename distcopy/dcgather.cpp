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

//The single source row is where the whole is rebuilt, each destination row holds the next chunk.
//Chunk order is row order - nothing recorded by the scatter is consulted, so the rows must be
//listed in the order the scatter used.
void planGather(TransferPlan & plan, const DistributionConfig & config, IContentInspector & inspector)
{
    LOG(MCdebugProgressDetail, "Setting up gather plan");
    const Holding & target = config.querySources()[0];
    const std::vector<Holding> & contributors = config.queryDestinations();

    //Every contributor must be readable and of one kind before anything is copied
    ContentKind kind = CKunknown;
    for (unsigned idx = 0; idx < contributors.size(); idx++)
    {
        const Holding & contributor = contributors[idx];
        ContentKind cur = inspector.queryKind(contributor);
        if (cur == CKunknown)
        {
            StringBuffer s;
            throwDcError1(DCERR_CouldNotInspect, contributor.describe(s).str());
        }
        if (idx == 0)
            kind = cur;
        else if (cur != kind)
        {
            StringBuffer s1, s2;
            throwDcError4(DCERR_MixedContributorKinds, contributor.describe(s1).str(), queryContentKindText(cur),
                          contributors[0].describe(s2).str(), queryContentKindText(kind));
        }
    }
    plan.setKind(kind);

    Holding to(target.node.c_str(), target.path.c_str());
    std::vector<TransferEdge> edges;
    for (unsigned idx = 0; idx < contributors.size(); idx++)
    {
        const Holding & contributor = contributors[idx];
        if (kind == CKfolder)
        {
            //Folder entries carry their own names, so merging the contents is enough
            std::string path(contributor.path);
            if (!contributor.trailingSlash)
                path += '/';
            TransferEdge edge(Holding(contributor.node.c_str(), path.c_str()), to);
            edge.selection.kind = CKfolder;
            edge.chunk = idx;
            if (edge.isSelfCopy())
            {
                StringBuffer s;
                LOG(MCdebugInfo, "Skipping copy of %s onto itself", contributor.describe(s).str());
                continue;
            }
            edges.push_back(edge);
        }
        else
        {
            TransferEdge edge(Holding(contributor.node.c_str(), contributor.path.c_str()), to);
            if (edge.isSelfCopy())
            {
                StringBuffer s;
                throwDcError1(DCERR_CopyFileOntoSelf, to.describe(s).str());
            }
            edge.selection.kind = CKfile;
            edge.chunk = idx;
            edge.append = (idx != 0);       // the first chunk replaces whatever the target held
            edges.push_back(edge);
        }
    }

    if (!edges.empty())
    {
        TransferRound & round = plan.addRound();
        round.orderedWrites = (kind == CKfile);
        round.edges.swap(edges);
    }
}
