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
#include "dcrange.hpp"

StringBuffer & ContentSelection::describe(StringBuffer & out) const
{
    if (whole)
        return out.append("all");
    out.appendf("%s [%" I64F "u,%" I64F "u)", (kind == CKfolder) ? "files" : "lines", from, to);
    return out;
}

//----------------------------------------------------------------------------

void sortFolderListing(std::vector<std::string> & files)
{
    //Byte-wise ordering of the full relative path, whatever order the listing arrived in
    StringArray names;
    for (const std::string & cur : files)
        names.append(cur.c_str());
    names.sortAscii(false);

    files.clear();
    ForEachItemIn(idx, names)
        files.push_back(names.item(idx));
}

void resolveExtent(ContentExtent & extent, IContentInspector & inspector, const Holding & holding)
{
    extent.kind = inspector.queryKind(holding);
    extent.files.clear();
    switch (extent.kind)
    {
    case CKfile:
        extent.size = inspector.countLines(holding);
        break;
    case CKfolder:
        inspector.listFiles(extent.files, holding);
        sortFolderListing(extent.files);
        extent.size = extent.files.size();
        break;
    default:
        {
            StringBuffer s;
            throwDcError1(DCERR_CouldNotInspect, holding.describe(s).str());
        }
    }

    StringBuffer s;
    LOG(MCdebugInfo, "Resolved %s: %s with %" I64F "u %s", holding.describe(s).str(), queryContentKindText(extent.kind), extent.size, extent.queryUnitText());
}

void resolveSelection(ContentSelection & selection, const ContentExtent & extent, const Holding & source, const Holding & requested)
{
    selection.kind = extent.kind;
    selection.files.clear();
    if (!requested.hasRange)
    {
        selection.whole = true;
        selection.from = 0;
        selection.to = extent.size;
        return;
    }

    if (requested.to <= requested.from)
    {
        StringBuffer s;
        throwDcError3(DCERR_EmptyRange, requested.from, requested.to, requested.describe(s).str());
    }
    if (requested.to > extent.size)
    {
        StringBuffer s1, s2;
        throw MakeStringException(DCERR_RangeExceedsExtent, DCERR_RangeExceedsExtent_Text, requested.from, requested.to,
                                  requested.describe(s1).str(), extent.size, extent.queryUnitText(), source.describe(s2).str());
    }

    selection.whole = false;
    selection.from = requested.from;
    selection.to = requested.to;
    if (extent.kind == CKfolder)
        selection.files.assign(extent.files.begin() + requested.from, extent.files.begin() + requested.to);
}
