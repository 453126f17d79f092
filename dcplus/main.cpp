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
#include "dcerror.hpp"
#include "dcplus.hpp"

void printVersion()
{
    printf("distcopy version: %d\n", DISTCOPY_VERSION);
}

void handleSyntax()
{
    StringBuffer out;

    out.append("Usage:\n");
    out.append("    distcopy [-v|--version] | action=[broadcast|scatter|gather] config=<csv> {<options>}\n");
    out.append("    distcopy broadcast|scatter|gather <csv> {<options>}\n\n");
    out.append("        -v | --version  -- display version info\n\n");
    out.append("    options:\n");
    out.append("        maxconnections=<n>  -- restrict to n concurrent transfers per round\n");
    out.append("                               (default 0, all at once)\n");
    out.append("        dryrun=0|1  -- compile and display the plan without copying anything\n");
    out.append("        saveplan=<xml-file>  -- save the compiled plan\n");
    out.append("        ssh=<command>  -- remote shell command, default is ssh\n");
    out.append("        rsync=<command>  -- synchronisation command, default is rsync -a\n");
    out.append("        @filename  -- read options from filename\n\n");
    out.append("    The config is a csv file with a header naming the columns\n");
    out.append("    direction,node,path{,from,to}.  direction is source or destination,\n");
    out.append("    from and to select lines of a file or sorted files of a folder.\n");

    printf("%s",out.str());
}

bool build_globals(int argc, const char *argv[], IProperties * globals)
{
    int i;

    for(i = 0; i < argc; i++)
    {
        if(argv[i] != NULL && argv[i][0] == '@' && argv[i][1] != '\0')
        {
            globals->loadFile(argv[i]+1);
        }
    }

    unsigned positional = 0;
    for (i = 1; i < argc; i++)
    {
        if (strchr(argv[i],'='))
        {
            globals->loadProp(argv[i]);
        }
        else if (argv[i][0] != '@')
        {
            //distcopy <action> <config>
            switch (positional++)
            {
            case 0:
                globals->setProp("action", argv[i]);
                break;
            case 1:
                globals->setProp("config", argv[i]);
                break;
            default:
                return false;
            }
        }
    }

    return true;
}

int main(int argc, const char* argv[])
{
    InitModuleObjects();

    if ((argc >= 2) && ((stricmp(argv[1], "/version") == 0) || (stricmp(argv[1], "-v") == 0)
        || (stricmp(argv[1], "--version") == 0)))
    {
        printVersion();
        return 0;
    }

    Owned<IFile> inifile = createIFile("distcopy.ini");
    if(argc < 2 && !(inifile->exists() && inifile->size() > 0))
    {
        handleSyntax();
        return 0;
    }

    if ((argc >= 2) && ((argv[1][0]=='/' || argv[1][0]=='-') && (argv[1][1]=='?' || argv[1][1]=='h')))
    {
        handleSyntax();
        return 0;
    }

    Owned<IProperties> globals = createProperties("distcopy.ini", true);

    if(!build_globals(argc, argv, globals))
    {
        fprintf(stderr, "ERROR: Invalid command syntax.\n");
        releaseAtoms();
        return getDistCopyExitStatus(DCERR_InvalidCommandSyntax);
    }

    const char* action = globals->queryProp("action");
    if(!action || !*action)
    {
        handleSyntax();
        fprintf(stderr, "\nERROR: please specify one action\n");
        releaseAtoms();
        return getDistCopyExitStatus(DCERR_TooFewArguments);
    }

    int ret = 0;
    try
    {
        Owned<CDistCopyHelper> helper = new CDistCopyHelper(LINK(globals.get()));
        ret = helper->doit();
    }
    catch(IMultiException* me)
    {
        ret = me->ordinality() ? me->item(0).errorCode() : me->errorCode();
        me->Release();
    }
    catch(IException* e)
    {
        StringBuffer errmsg;
        e->errorMessage(errmsg);
        fprintf(stderr, "ERROR: %d: %s\n", e->errorCode(), errmsg.str());
        ret = e->errorCode();
        e->Release();
    }

    releaseAtoms();
    //The shell only sees the low byte, so report the class of the error rather than its code
    return getDistCopyExitStatus(ret);
}
