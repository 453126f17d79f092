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
#include "jfile.hpp"
#include "jlog.hpp"
#include "jsort.hpp"

#include "dcerror.hpp"
#include "dcconfig.hpp"

//Use hash defines for the column names so I can't mis-spell them....
#define CNdirection         "direction"
#define CNnode              "node"
#define CNpath              "path"
#define CNfrom              "from"
#define CNto                "to"

// Paths are handed to a remote shell unquoted
static const char * const unsafePathChars = " \t\r\n'\"`$;|&<>()\\";

bool hasTrailingSlash(const char * path)
{
    size_t len = path ? strlen(path) : 0;
    return (len != 0) && (path[len-1] == '/');
}

bool isShellSafePath(const char * path)
{
    return strpbrk(path, unsafePathChars) == nullptr;
}

//Host names, IP addresses and user@host. A leading '-' would be read by ssh as an option.
bool isValidNodeName(const char * node)
{
    if (!node || !*node || (*node == '-'))
        return false;
    for (const char * finger = node; *finger; finger++)
    {
        char next = *finger;
        if (!isalnum((byte)next) && !strchr(".-_@", next))
            return false;
    }
    return true;
}

//Length of a path ignoring trailing separators, so /data/x and /data/x/ name the same location
size32_t getComparablePathLength(const char * path)
{
    size32_t len = (size32_t)strlen(path);
    while ((len > 1) && (path[len-1] == '/'))
        len--;
    return len;
}

//----------------------------------------------------------------------------

Holding::Holding(const char * _node, const char * _path) : node(_node), path(_path)
{
    trailingSlash = hasTrailingSlash(_path);
}

Holding::Holding(const char * _node, const char * _path, unsigned __int64 _from, unsigned __int64 _to)
    : node(_node), path(_path), from(_from), to(_to), hasRange(true)
{
    trailingSlash = hasTrailingSlash(_path);
}

StringBuffer & Holding::describe(StringBuffer & out) const
{
    out.append(node.c_str()).append(':').append(path.c_str());
    if (hasRange)
        out.appendf("[%" I64F "u,%" I64F "u)", from, to);
    return out;
}

bool Holding::sameLocation(const Holding & other) const
{
    if (node != other.node)
        return false;
    size32_t len = getComparablePathLength(path.c_str());
    if (len != getComparablePathLength(other.path.c_str()))
        return false;
    return path.compare(0, len, other.path, 0, len) == 0;
}

bool Holding::overlaps(const Holding & other) const
{
    if (!hasRange || !other.hasRange)
        return false;
    return (from < other.to) && (other.from < to);
}

//----------------------------------------------------------------------------

DistributionDirection getDistributionDirection(const char * text, unsigned row)
{
    if (stricmp(text, "source") == 0)
        return DDsource;
    if (stricmp(text, "destination") == 0)
        return DDdestination;
    throwDcError2(DCERR_UnknownDirection, text, row);
}

static void trimField(std::string & field)
{
    size_t first = field.find_first_not_of(" \t\r");
    if (first == std::string::npos)
    {
        field.clear();
        return;
    }
    size_t last = field.find_last_not_of(" \t\r");
    field = field.substr(first, last - first + 1);
}

static void splitCsvLine(std::vector<std::string> & fields, const char * line)
{
    fields.clear();
    std::string cur;
    bool quoted = false;
    for (const char * finger = line; *finger; finger++)
    {
        char next = *finger;
        if (quoted)
        {
            if (next != '"')
                cur += next;
            else if (finger[1] == '"')
            {
                cur += '"';
                finger++;
            }
            else
                quoted = false;
        }
        else if (next == '"')
            quoted = true;
        else if (next == ',')
        {
            trimField(cur);
            fields.push_back(cur);
            cur.clear();
        }
        else
            cur += next;
    }
    trimField(cur);
    fields.push_back(cur);
}

static bool readRangeValue(unsigned __int64 & value, std::string text, const char * name, unsigned row)
{
    if (text.empty())
        return false;

    //A column with blank cells is written back by pandas as floats, e.g. "2.0"
    size_t len = text.length();
    if ((len > 2) && (text.compare(len-2, 2, ".0") == 0))
        text.resize(len-2);

    if (text.find_first_not_of("0123456789") != std::string::npos)
        throwDcError3(DCERR_InvalidRangeValue, name, text.c_str(), row);
    value = strtoull(text.c_str(), nullptr, 10);
    return true;
}

static int findColumn(const std::vector<std::string> & header, const char * name, bool required)
{
    for (unsigned i = 0; i < header.size(); i++)
    {
        if (stricmp(header[i].c_str(), name) == 0)
            return (int)i;
    }
    if (required)
        throwDcError1(DCERR_MissingConfigColumn, name);
    return -1;
}

//----------------------------------------------------------------------------

void DistributionConfig::addRow(DistributionDirection direction, const Holding & holding, unsigned row)
{
    if (holding.node.empty())
        throwDcError1(DCERR_EmptyNode, row);
    if (!isValidNodeName(holding.node.c_str()))
        throwDcError2(DCERR_UnsafeNode, holding.node.c_str(), row);
    if (holding.path.empty())
        throwDcError1(DCERR_EmptyPath, row);
    if (!isShellSafePath(holding.path.c_str()))
        throwDcError2(DCERR_UnsafePath, holding.path.c_str(), row);
    if (holding.hasRange && (holding.to <= holding.from))
    {
        StringBuffer s;
        throwDcError3(DCERR_EmptyRange, holding.from, holding.to, holding.describe(s).str());
    }

    if (direction == DDsource)
        sources.push_back(holding);
    else
        destinations.push_back(holding);
}

void DistributionConfig::clear()
{
    sources.clear();
    destinations.clear();
}

void DistributionConfig::loadCsv(const char * text)
{
    std::vector<std::string> header;
    std::vector<std::string> fields;
    int directionColumn = -1;
    int nodeColumn = -1;
    int pathColumn = -1;
    int fromColumn = -1;
    int toColumn = -1;

    unsigned lineNo = 0;
    const char * cur = text;
    while (*cur)
    {
        const char * eol = strchr(cur, '\n');
        size_t len = eol ? (size_t)(eol - cur) : strlen(cur);
        std::string line(cur, len);
        cur += len;
        if (*cur)
            cur++;
        lineNo++;

        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        if (header.empty())
        {
            splitCsvLine(header, line.c_str());
            directionColumn = findColumn(header, CNdirection, true);
            nodeColumn = findColumn(header, CNnode, true);
            pathColumn = findColumn(header, CNpath, true);
            fromColumn = findColumn(header, CNfrom, false);
            toColumn = findColumn(header, CNto, false);
            continue;
        }

        splitCsvLine(fields, line.c_str());
        if (fields.size() > header.size())
            throwDcError3(DCERR_MalformedRow, lineNo, (unsigned)fields.size(), (unsigned)header.size());
        //Missing trailing cells are unset, as a spreadsheet export would leave them
        fields.resize(header.size());

        DistributionDirection direction = getDistributionDirection(fields[directionColumn].c_str(), lineNo);
        unsigned __int64 from = 0;
        unsigned __int64 to = 0;
        bool hasFrom = (fromColumn >= 0) && readRangeValue(from, fields[fromColumn], CNfrom, lineNo);
        bool hasTo = (toColumn >= 0) && readRangeValue(to, fields[toColumn], CNto, lineNo);
        if (hasFrom != hasTo)
            throwDcError1(DCERR_IncompleteRange, lineNo);

        const char * node = fields[nodeColumn].c_str();
        const char * path = fields[pathColumn].c_str();
        if (hasFrom)
            addRow(direction, Holding(node, path, from, to), lineNo);
        else
            addRow(direction, Holding(node, path), lineNo);
    }

    if (header.empty())
        throwDcError1(DCERR_MissingConfigColumn, CNdirection);
    LOG(MCdebugInfo, "Loaded distribution config: %u source(s), %u destination(s)", numSources(), numDestinations());
}

void DistributionConfig::loadCsvFile(const char * filename)
{
    StringBuffer text;
    try
    {
        text.loadFile(filename);
    }
    catch (IException * e)
    {
        EXCLOG(e, "Failed to read distribution config");
        e->Release();
        throwDcError1(DCERR_CouldNotReadConfig, filename);
    }
    loadCsv(text.str());
}

//Each destination node is written once per plan, whatever path it is given
void DistributionConfig::checkDuplicateDestinations() const
{
    for (unsigned i = 1; i < destinations.size(); i++)
    {
        for (unsigned j = 0; j < i; j++)
        {
            if (destinations[i].node == destinations[j].node)
            {
                StringBuffer s;
                destinations[j].describe(s).append(", ");
                destinations[i].describe(s);
                throwDcError2(DCERR_DuplicateDestination, destinations[i].node.c_str(), s.str());
            }
        }
    }
}

class HoldingRangeCompare : public ICompare
{
public:
    virtual int docompare(const void * left, const void * right) const
    {
        const Holding * l = (const Holding *)left;
        const Holding * r = (const Holding *)right;
        if (l->from < r->from)
            return -1;
        return (l->from > r->from) ? +1 : 0;
    }
};

void DistributionConfig::checkRanges(bool requireRange) const
{
    std::vector<const Holding *> ordered;
    for (const Holding & cur : destinations)
    {
        if (cur.hasRange)
            ordered.push_back(&cur);
        else if (requireRange)
        {
            StringBuffer s;
            throwDcError1(DCERR_MissingRange, cur.describe(s).str());
        }
    }

    HoldingRangeCompare compare;
    qsortvec((void * *)ordered.data(), (size32_t)ordered.size(), compare);
    for (unsigned i = 1; i < ordered.size(); i++)
    {
        if (ordered[i-1]->overlaps(*ordered[i]))
        {
            StringBuffer s1, s2;
            throwDcError2(DCERR_OverlappingRanges, ordered[i-1]->describe(s1).str(), ordered[i]->describe(s2).str());
        }
    }
}

void DistributionConfig::validate(DistributionMode mode) const
{
    switch (mode)
    {
    case DMbroadcast:
    case DMscatter:
        if (sources.empty())
            throwDcError(DCERR_NoSources);
        if (destinations.empty())
            throwDcError(DCERR_NoDestinations);
        checkDuplicateDestinations();
        if (mode == DMscatter)
            checkRanges(true);
        break;
    case DMgather:
        if (sources.size() != 1)
            throwDcError1(DCERR_GatherNeedsOneTarget, numSources());
        if (destinations.empty())
            throwDcError(DCERR_NoDestinations);
        //Ranges on contributors are not used to order the chunks, but they must still describe distinct data
        checkRanges(false);
        break;
    default:
        throwDcError1(DCERR_UnknownMode, queryDistributionModeText(mode));
    }
}
