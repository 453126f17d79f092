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
#include "jutil.hpp"

#include "dcerror.hpp"
#include "dctransfer.hpp"

#define DEFAULT_SSH_COMMAND     "ssh"
#define DEFAULT_RSYNC_COMMAND   "rsync -a"

StringBuffer & getStagingName(StringBuffer & out, const Holding & target, unsigned chunk)
{
    return out.append(target.path.c_str()).appendf(".part%u.tmp", chunk);
}

StringBuffer & getParentPath(StringBuffer & out, const char * path)
{
    StringBuffer trimmed(path);
    while ((trimmed.length() > 1) && (trimmed.charAt(trimmed.length()-1) == '/'))
        trimmed.setLength(trimmed.length()-1);
    const char * tail = strrchr(trimmed.str(), '/');
    if (!tail)
        return out.append(".");
    if (tail == trimmed.str())
        return out.append("/");
    return out.append((size32_t)(tail - trimmed.str()), trimmed.str());
}

static StringBuffer & stripTrailingSlash(StringBuffer & out, const char * path)
{
    out.append(path);
    while ((out.length() > 1) && (out.charAt(out.length()-1) == '/'))
        out.setLength(out.length()-1);
    return out;
}

//----------------------------------------------------------------------------

class CShellCommandRunner
{
public:
    CShellCommandRunner(IPropertyTree * options)
    {
        sshCommand.set(options ? options->queryProp("@sshCommand") : nullptr);
        if (sshCommand.isEmpty())
            sshCommand.set(DEFAULT_SSH_COMMAND);
        rsyncCommand.set(options ? options->queryProp("@rsyncCommand") : nullptr);
        if (rsyncCommand.isEmpty())
            rsyncCommand.set(DEFAULT_RSYNC_COMMAND);
    }

    //Returns the exit code of the command, output and error text are returned to the caller
    unsigned run(StringBuffer & output, StringBuffer & error, const char * command, const char * input)
    {
        DBGLOG("Running %s", command);
        unsigned ret = runExternalCommand(output, error, command, input);
        if (ret)
            DBGLOG("%s returned %u: %s", command, ret, error.str());
        return ret;
    }

    void runChecked(const char * command, const char * input = nullptr)
    {
        StringBuffer output, error;
        unsigned ret = run(output, error, command, input);
        if (ret)
        {
            error.trim();
            StringBuffer msg(command);
            if (error.length())
                msg.append(": ").append(error);
            throwDcError2(DCERR_CommandFailed, ret, msg.str());
        }
    }

    StringBuffer & remote(StringBuffer & out, const char * node, const char * command) const
    {
        return out.append(sshCommand.get()).append(' ').append(node).append(" \"").append(command).append('"');
    }

public:
    StringAttr sshCommand;
    StringAttr rsyncCommand;
};

//----------------------------------------------------------------------------

class CShellTransferAgent : public CInterfaceOf<ITransferAgent>
{
public:
    CShellTransferAgent(IPropertyTree * options) : runner(options)
    {
    }

    virtual void copy(const TransferEdge & edge, const char * targetPath) override
    {
        const ContentSelection & selection = edge.selection;
        if ((selection.kind == CKfile) && !selection.whole)
            copyLines(edge, targetPath);
        else if (selection.kind == CKfile)
            streamFile(edge, targetPath);
        else if ((selection.kind == CKfolder) && !selection.whole)
            copyFolderSubset(edge, targetPath);
        else
            copyWhole(edge, targetPath);
    }

    virtual void commit(const Holding & target, const char * stagedPath, bool append) override
    {
        VStringBuffer script("cat %s %s %s && rm -f %s", stagedPath, append ? ">>" : ">", target.path.c_str(), stagedPath);
        StringBuffer command;
        runner.runChecked(runner.remote(command, target.node.c_str(), script.str()).str());
    }

    virtual void remove(const char * node, const char * path) override
    {
        VStringBuffer script("rm -f %s", path);
        StringBuffer command;
        runner.runChecked(runner.remote(command, node, script.str()).str());
    }

protected:
    void copyWhole(const TransferEdge & edge, const char * targetPath)
    {
        StringBuffer parent;
        getParentPath(parent, targetPath);
        VStringBuffer script("mkdir -p %s && %s %s:%s %s", parent.str(), runner.rsyncCommand.get(), edge.from.node.c_str(), edge.from.path.c_str(), targetPath);
        StringBuffer command;
        runner.runChecked(runner.remote(command, edge.to.node.c_str(), script.str()).str());
    }

    void copyFolderSubset(const TransferEdge & edge, const char * targetPath)
    {
        //The listing is relative to the folder, so rsync is always given the folder's contents
        StringBuffer source, target;
        stripTrailingSlash(source, edge.from.path.c_str()).append('/');
        stripTrailingSlash(target, targetPath).append('/');
        VStringBuffer script("mkdir -p %s && %s --files-from=- %s:%s %s", target.str(), runner.rsyncCommand.get(), edge.from.node.c_str(), source.str(), target.str());

        StringBuffer fileList;
        for (const std::string & cur : edge.selection.files)
            fileList.append(cur.c_str()).newline();

        StringBuffer command;
        runner.runChecked(runner.remote(command, edge.to.node.c_str(), script.str()).str(), fileList.str());
    }

    void copyLines(const TransferEdge & edge, const char * targetPath)
    {
        const ContentSelection & selection = edge.selection;
        StringBuffer parent;
        getParentPath(parent, targetPath);
        VStringBuffer script("sed -n '%" I64F "u,%" I64F "up' %s | %s %s 'mkdir -p %s && cat > %s'",
                             selection.from+1, selection.to, edge.from.path.c_str(), runner.sshCommand.get(), edge.to.node.c_str(), parent.str(), targetPath);
        StringBuffer command;
        runner.runChecked(runner.remote(command, edge.from.node.c_str(), script.str()).str());
    }

    void streamFile(const TransferEdge & edge, const char * targetPath)
    {
        StringBuffer parent;
        getParentPath(parent, targetPath);
        VStringBuffer script("cat %s | %s %s 'mkdir -p %s && cat > %s'",
                             edge.from.path.c_str(), runner.sshCommand.get(), edge.to.node.c_str(), parent.str(), targetPath);
        StringBuffer command;
        runner.runChecked(runner.remote(command, edge.from.node.c_str(), script.str()).str());
    }

protected:
    CShellCommandRunner runner;
};

//----------------------------------------------------------------------------

class CShellContentInspector : public CInterfaceOf<IContentInspector>
{
public:
    CShellContentInspector(IPropertyTree * options) : runner(options)
    {
    }

    virtual ContentKind queryKind(const Holding & holding) override
    {
        if (test(holding, "-f"))
            return CKfile;
        if (test(holding, "-d"))
            return CKfolder;
        return CKunknown;
    }

    virtual unsigned __int64 countLines(const Holding & holding) override
    {
        VStringBuffer script("wc -l < %s", holding.path.c_str());
        StringBuffer command, output, error;
        runner.remote(command, holding.node.c_str(), script.str());
        StringBuffer s;
        if (runner.run(output, error, command.str(), nullptr) != 0)
            throwDcError1(DCERR_CouldNotCountLines, holding.describe(s).str());

        output.trim();
        if (!output.length())
            throwDcError1(DCERR_CouldNotCountLines, holding.describe(s).str());
        for (unsigned i = 0; i < output.length(); i++)
        {
            if (!isdigit((unsigned char)output.charAt(i)))
                throwDcError1(DCERR_CouldNotCountLines, holding.describe(s).str());
        }
        return strtoull(output.str(), nullptr, 10);
    }

    virtual void listFiles(std::vector<std::string> & files, const Holding & holding) override
    {
        StringBuffer base;
        stripTrailingSlash(base, holding.path.c_str());
        VStringBuffer script("find %s -type f", base.str());
        StringBuffer command, output, error;
        runner.remote(command, holding.node.c_str(), script.str());
        StringBuffer s;
        if (runner.run(output, error, command.str(), nullptr) != 0)
            throwDcError1(DCERR_CouldNotListFolder, holding.describe(s).str());

        if (base.length() > 1)
            base.append('/');
        StringArray lines;
        lines.appendList(output.str(), "\n");
        files.clear();
        ForEachItemIn(i, lines)
        {
            const char * line = lines.item(i);
            if (!*line)
                continue;
            if (strncmp(line, base.str(), base.length()) != 0)
                throwDcError1(DCERR_CouldNotListFolder, holding.describe(s).str());
            files.emplace_back(line + base.length());
        }
    }

protected:
    bool test(const Holding & holding, const char * flag)
    {
        VStringBuffer script("test %s %s", flag, holding.path.c_str());
        StringBuffer command, output, error;
        runner.remote(command, holding.node.c_str(), script.str());
        return runner.run(output, error, command.str(), nullptr) == 0;
    }

protected:
    CShellCommandRunner runner;
};

//----------------------------------------------------------------------------

ITransferAgent * createShellTransferAgent(IPropertyTree * options)
{
    return new CShellTransferAgent(options);
}

IContentInspector * createShellContentInspector(IPropertyTree * options)
{
    return new CShellContentInspector(options);
}
