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

#ifndef _DCTESTHELPERS_HPP__
#define _DCTESTHELPERS_HPP__

#ifdef _USE_CPPUNIT

#include <atomic>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "jliball.hpp"
#include "dcconfig.hpp"
#include "dcrange.hpp"
#include "dctransfer.hpp"

//Files held on a set of simulated nodes.  A folder is any path that prefixes a stored file.
class MemoryCluster
{
public:
    void addFile(const char * node, const char * path, const char * content);
    void removeFile(const char * node, const char * path);
    void appendFile(const char * node, const char * path, const std::string & content);

    bool isFile(const char * node, const char * path) const;
    bool isFolder(const char * node, const char * path) const;
    bool getFile(std::string & content, const char * node, const char * path) const;
    std::string queryContent(const char * node, const char * path) const;
    void listFiles(std::vector<std::string> & files, const char * node, const char * path) const;     // relative, unsorted
    unsigned numFiles() const;

protected:
    typedef std::pair<std::string, std::string> Location;

    static std::string normalize(const char * path);

protected:
    mutable CriticalSection crit;
    std::map<Location, std::string> files;
};

class CMemoryContentInspector : public CInterfaceOf<IContentInspector>
{
public:
    CMemoryContentInspector(MemoryCluster & _cluster) : cluster(_cluster) {}

    virtual ContentKind queryKind(const Holding & holding) override;
    virtual unsigned __int64 countLines(const Holding & holding) override;
    virtual void listFiles(std::vector<std::string> & files, const Holding & holding) override;

    void failNode(const char * node)    { failedNodes.insert(node); }
    void setReverseListing(bool value)  { reverseListing = value; }
    unsigned queryInspections() const   { return inspections; }

protected:
    void checkNode(const Holding & holding, int code);

protected:
    MemoryCluster & cluster;
    std::set<std::string> failedNodes;
    bool reverseListing = false;
    unsigned inspections = 0;
};

//Copies between the nodes of a MemoryCluster the way the shell agent's rsync and sed commands would
class CMemoryTransferAgent : public CInterfaceOf<ITransferAgent>
{
public:
    struct CopyRecord
    {
        std::string from;
        std::string to;
        std::string targetPath;
    };

public:
    CMemoryTransferAgent(MemoryCluster & _cluster) : cluster(_cluster) {}

    virtual void copy(const TransferEdge & edge, const char * targetPath) override;
    virtual void commit(const Holding & target, const char * stagedPath, bool append) override;
    virtual void remove(const char * node, const char * path) override;

    void failCopiesTo(const char * node)        { failedTargets.insert(node); }
    void failCommits()                          { failCommit = true; }
    unsigned queryCopies() const                { return numCopies; }
    unsigned queryCommits() const               { return numCommits; }
    unsigned queryMaxActive() const             { return maxActive; }
    void getHistory(std::vector<CopyRecord> & out) const;

protected:
    void copyContent(const TransferEdge & edge, const char * targetPath);

protected:
    MemoryCluster & cluster;
    mutable CriticalSection crit;
    std::set<std::string> failedTargets;
    std::vector<CopyRecord> history;
    bool failCommit = false;
    std::atomic<unsigned> numCopies{0};
    std::atomic<unsigned> numCommits{0};
    std::atomic<unsigned> active{0};
    std::atomic<unsigned> maxActive{0};
};

extern std::string sliceLines(const std::string & content, unsigned __int64 from, unsigned __int64 to);
extern unsigned __int64 countContentLines(const std::string & content);

//Runs func and returns the code of the IException it throws, or 0 if nothing was thrown
extern int captureErrorCode(const std::function<void()> & func);

#endif

#endif
