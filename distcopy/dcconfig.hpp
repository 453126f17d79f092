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

#ifndef DCCONFIG_HPP
#define DCCONFIG_HPP

#include <string>
#include <vector>

#include "jstring.hpp"
#include "distcopy.hpp"

//Data known to reside somewhere: a node, a path and optionally a [from,to) slice of it.
//A trailing separator on the path means "the contents of the folder" rather than the folder itself.
struct DISTCOPY_API Holding
{
public:
    Holding() = default;
    Holding(const char * _node, const char * _path);
    Holding(const char * _node, const char * _path, unsigned __int64 _from, unsigned __int64 _to);

    StringBuffer & describe(StringBuffer & out) const;
    bool overlaps(const Holding & other) const;
    bool sameLocation(const Holding & other) const;

public:
    std::string         node;
    std::string         path;
    unsigned __int64    from = 0;
    unsigned __int64    to = 0;
    bool                hasRange = false;
    bool                trailingSlash = false;
};

extern DISTCOPY_API bool hasTrailingSlash(const char * path);
extern DISTCOPY_API bool isShellSafePath(const char * path);
extern DISTCOPY_API bool isValidNodeName(const char * node);
extern DISTCOPY_API size32_t getComparablePathLength(const char * path);

//A distribution request: the source and destination rows of a config, each kept in declared order.
class DISTCOPY_API DistributionConfig
{
public:
    void addRow(DistributionDirection direction, const Holding & holding, unsigned row = 0);
    void clear();
    void loadCsv(const char * text);
    void loadCsvFile(const char * filename);
    void validate(DistributionMode mode) const;

    const std::vector<Holding> & querySources() const       { return sources; }
    const std::vector<Holding> & queryDestinations() const  { return destinations; }
    unsigned numSources() const                             { return (unsigned)sources.size(); }
    unsigned numDestinations() const                        { return (unsigned)destinations.size(); }

protected:
    void checkDuplicateDestinations() const;
    void checkRanges(bool requireRange) const;

protected:
    std::vector<Holding> sources;
    std::vector<Holding> destinations;
};

extern DISTCOPY_API DistributionDirection getDistributionDirection(const char * text, unsigned row);

#endif
