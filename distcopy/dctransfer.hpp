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

#ifndef DCTRANSFER_HPP
#define DCTRANSFER_HPP

#include "jiface.hpp"
#include "jptree.hpp"
#include "distcopy.hpp"
#include "dcplan.hpp"

//Performs the copies a plan asks for.  Every failure is reported by throwing an IException.
interface ITransferAgent : extends IInterface
{
    //Copy the selected part of edge.from to targetPath on edge.to.node
    virtual void copy(const TransferEdge & edge, const char * targetPath) = 0;
    //Move a staged chunk into the target, replacing the target unless append is set
    virtual void commit(const Holding & target, const char * stagedPath, bool append) = 0;
    virtual void remove(const char * node, const char * path) = 0;
};

extern DISTCOPY_API ITransferAgent * createShellTransferAgent(IPropertyTree * options);
extern DISTCOPY_API IContentInspector * createShellContentInspector(IPropertyTree * options);

extern DISTCOPY_API StringBuffer & getStagingName(StringBuffer & out, const Holding & target, unsigned chunk);
extern DISTCOPY_API StringBuffer & getParentPath(StringBuffer & out, const char * path);

#endif
