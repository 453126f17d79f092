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

#ifndef DCRANGE_HPP
#define DCRANGE_HPP

#include <string>
#include <vector>

#include "jiface.hpp"
#include "distcopy.hpp"
#include "dcconfig.hpp"

//Answers questions about the content of a holding.  Implementations report failures as resolution errors.
interface IContentInspector : extends IInterface
{
    virtual ContentKind queryKind(const Holding & holding) = 0;
    virtual unsigned __int64 countLines(const Holding & holding) = 0;
    virtual void listFiles(std::vector<std::string> & files, const Holding & holding) = 0;     // relative to holding.path, in any order
};

//The full extent of some content: a number of lines, or the sorted relative names of the files in a folder
struct DISTCOPY_API ContentExtent
{
public:
    const char * queryUnitText() const  { return (kind == CKfolder) ? "files" : "lines"; }

public:
    ContentKind                 kind = CKunknown;
    unsigned __int64            size = 0;
    std::vector<std::string>    files;
};

//The part of a source that a single transfer reads
struct DISTCOPY_API ContentSelection
{
public:
    StringBuffer & describe(StringBuffer & out) const;

public:
    ContentKind                 kind = CKunknown;
    bool                        whole = true;
    unsigned __int64            from = 0;
    unsigned __int64            to = 0;
    std::vector<std::string>    files;          // folder slices only
};

extern DISTCOPY_API void sortFolderListing(std::vector<std::string> & files);
extern DISTCOPY_API void resolveExtent(ContentExtent & extent, IContentInspector & inspector, const Holding & holding);
extern DISTCOPY_API void resolveSelection(ContentSelection & selection, const ContentExtent & extent, const Holding & source, const Holding & requested);

#endif
