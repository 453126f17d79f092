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

#ifdef _USE_CPPUNIT

#include <algorithm>

#include "dcerror.hpp"
#include "dctesthelpers.hpp"

static std::string normalizePath(const char * path)
{
    std::string ret(path);
    while ((ret.length() > 1) && (ret.back() == '/'))
        ret.pop_back();
    return ret;
}

static std::string queryTail(const std::string & path)
{
    std::string trimmed = normalizePath(path.c_str());
    size_t slash = trimmed.rfind('/');
    return (slash == std::string::npos) ? trimmed : trimmed.substr(slash+1);
}

std::string sliceLines(const std::string & content, unsigned __int64 from, unsigned __int64 to)
{
    std::string ret;
    unsigned __int64 line = 0;
    size_t start = 0;
    while ((start < content.length()) && (line < to))
    {
        size_t eol = content.find('\n', start);
        size_t end = (eol == std::string::npos) ? content.length() : eol+1;
        if (line >= from)
            ret.append(content, start, end - start);
        start = end;
        line++;
    }
    return ret;
}

unsigned __int64 countContentLines(const std::string & content)
{
    return (unsigned __int64)std::count(content.begin(), content.end(), '\n');
}

int captureErrorCode(const std::function<void()> & func)
{
    try
    {
        func();
    }
    catch (IMultiException * me)
    {
        int code = me->ordinality() ? me->item(0).errorCode() : me->errorCode();
        me->Release();
        return code;
    }
    catch (IException * e)
    {
        int code = e->errorCode();
        e->Release();
        return code;
    }
    return 0;
}

//----------------------------------------------------------------------------

std::string MemoryCluster::normalize(const char * path)
{
    return normalizePath(path);
}

void MemoryCluster::addFile(const char * node, const char * path, const char * content)
{
    CriticalBlock block(crit);
    files[Location(node, normalize(path))] = content;
}

void MemoryCluster::removeFile(const char * node, const char * path)
{
    CriticalBlock block(crit);
    files.erase(Location(node, normalize(path)));
}

void MemoryCluster::appendFile(const char * node, const char * path, const std::string & content)
{
    CriticalBlock block(crit);
    files[Location(node, normalize(path))].append(content);
}

bool MemoryCluster::isFile(const char * node, const char * path) const
{
    CriticalBlock block(crit);
    return files.find(Location(node, normalize(path))) != files.end();
}

bool MemoryCluster::isFolder(const char * node, const char * path) const
{
    std::string prefix = normalize(path) + "/";
    CriticalBlock block(crit);
    for (const auto & cur : files)
    {
        if ((cur.first.first == node) && (cur.first.second.compare(0, prefix.length(), prefix) == 0))
            return true;
    }
    return false;
}

bool MemoryCluster::getFile(std::string & content, const char * node, const char * path) const
{
    CriticalBlock block(crit);
    auto match = files.find(Location(node, normalize(path)));
    if (match == files.end())
        return false;
    content = match->second;
    return true;
}

std::string MemoryCluster::queryContent(const char * node, const char * path) const
{
    std::string content;
    getFile(content, node, path);
    return content;
}

void MemoryCluster::listFiles(std::vector<std::string> & out, const char * node, const char * path) const
{
    std::string prefix = normalize(path) + "/";
    out.clear();
    CriticalBlock block(crit);
    for (const auto & cur : files)
    {
        if ((cur.first.first == node) && (cur.first.second.compare(0, prefix.length(), prefix) == 0))
            out.push_back(cur.first.second.substr(prefix.length()));
    }
}

unsigned MemoryCluster::numFiles() const
{
    CriticalBlock block(crit);
    return (unsigned)files.size();
}

//----------------------------------------------------------------------------

void CMemoryContentInspector::checkNode(const Holding & holding, int code)
{
    inspections++;
    if (failedNodes.count(holding.node))
    {
        StringBuffer s;
        throw MakeStringException(code, "%s: ssh: connect to host %s port 22: Connection refused", holding.describe(s).str(), holding.node.c_str());
    }
}

ContentKind CMemoryContentInspector::queryKind(const Holding & holding)
{
    checkNode(holding, DCERR_CouldNotInspect);
    if (cluster.isFile(holding.node.c_str(), holding.path.c_str()))
        return CKfile;
    if (cluster.isFolder(holding.node.c_str(), holding.path.c_str()))
        return CKfolder;
    return CKunknown;
}

unsigned __int64 CMemoryContentInspector::countLines(const Holding & holding)
{
    checkNode(holding, DCERR_CouldNotCountLines);
    std::string content;
    if (!cluster.getFile(content, holding.node.c_str(), holding.path.c_str()))
    {
        StringBuffer s;
        throwDcError1(DCERR_CouldNotCountLines, holding.describe(s).str());
    }
    return countContentLines(content);
}

void CMemoryContentInspector::listFiles(std::vector<std::string> & out, const Holding & holding)
{
    checkNode(holding, DCERR_CouldNotListFolder);
    cluster.listFiles(out, holding.node.c_str(), holding.path.c_str());
    //The map is ordered, so reversing gives a listing that a resolver must re-sort
    if (reverseListing)
        std::reverse(out.begin(), out.end());
}

//----------------------------------------------------------------------------

void CMemoryTransferAgent::copy(const TransferEdge & edge, const char * targetPath)
{
    {
        CriticalBlock block(crit);
        unsigned now = ++active;
        if (now > maxActive)
            maxActive = now;
    }
    try
    {
        copyContent(edge, targetPath);
    }
    catch (IException *)
    {
        --active;
        throw;
    }
    --active;
    ++numCopies;

    StringBuffer from, to;
    CopyRecord record;
    record.from = edge.from.describe(from).str();
    record.to = edge.to.describe(to).str();
    record.targetPath = targetPath;
    CriticalBlock block(crit);
    history.push_back(record);
}

void CMemoryTransferAgent::copyContent(const TransferEdge & edge, const char * targetPath)
{
    const Holding & from = edge.from;
    const ContentSelection & selection = edge.selection;
    if (failedTargets.count(edge.to.node))
        throwDcError2(DCERR_CommandFailed, 255, "ssh: connect to host port 22: Connection refused");

    std::string content;
    if (cluster.getFile(content, from.node.c_str(), from.path.c_str()))
    {
        if ((selection.kind == CKfile) && !selection.whole)
            content = sliceLines(content, selection.from, selection.to);
        cluster.addFile(edge.to.node.c_str(), targetPath, content.c_str());
        return;
    }

    if (!cluster.isFolder(from.node.c_str(), from.path.c_str()))
    {
        VStringBuffer msg("rsync: link_stat \"%s\" failed: No such file or directory", from.path.c_str());
        throwDcError2(DCERR_CommandFailed, 23, msg.str());
    }

    std::vector<std::string> names;
    if (selection.whole)
        cluster.listFiles(names, from.node.c_str(), from.path.c_str());
    else
        names = selection.files;

    //Like rsync: without a trailing slash an existing target folder receives the folder itself
    std::string base = normalizePath(targetPath);
    bool contentsOnly = from.trailingSlash || !selection.whole;
    if (!contentsOnly && cluster.isFolder(edge.to.node.c_str(), targetPath))
        base.append("/").append(queryTail(from.path));

    std::string source = normalizePath(from.path.c_str());
    for (const std::string & name : names)
    {
        std::string srcName = source + "/" + name;
        if (!cluster.getFile(content, from.node.c_str(), srcName.c_str()))
        {
            VStringBuffer msg("rsync: link_stat \"%s\" failed: No such file or directory", srcName.c_str());
            throwDcError2(DCERR_CommandFailed, 23, msg.str());
        }
        std::string dstName = base + "/" + name;
        cluster.addFile(edge.to.node.c_str(), dstName.c_str(), content.c_str());
    }
}

void CMemoryTransferAgent::commit(const Holding & target, const char * stagedPath, bool append)
{
    if (failCommit)
        throwDcError2(DCERR_CommandFailed, 1, "cat: write error: No space left on device");

    std::string content;
    if (!cluster.getFile(content, target.node.c_str(), stagedPath))
    {
        VStringBuffer msg("cat: %s: No such file or directory", stagedPath);
        throwDcError2(DCERR_CommandFailed, 1, msg.str());
    }
    if (append)
        cluster.appendFile(target.node.c_str(), target.path.c_str(), content);
    else
        cluster.addFile(target.node.c_str(), target.path.c_str(), content.c_str());
    cluster.removeFile(target.node.c_str(), stagedPath);
    ++numCommits;
}

void CMemoryTransferAgent::remove(const char * node, const char * path)
{
    cluster.removeFile(node, path);
}

void CMemoryTransferAgent::getHistory(std::vector<CopyRecord> & out) const
{
    CriticalBlock block(crit);
    out = history;
}

#endif
