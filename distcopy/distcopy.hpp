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

#ifndef DISTCOPY_HPP
#define DISTCOPY_HPP

#ifdef _WIN32
#ifdef DISTCOPY_EXPORTS
#define DISTCOPY_API __declspec(dllexport)
#else
#define DISTCOPY_API __declspec(dllimport)
#endif
#else
#define DISTCOPY_API
#endif

#include "jlib.hpp"

#define DISTCOPY_VERSION        1

enum DistributionMode
{
    DMbroadcast,
    DMscatter,
    DMgather,
    DMlast
};

enum DistributionDirection
{
    DDsource,
    DDdestination
};

enum ContentKind
{
    CKunknown,
    CKfile,                 // sliced by lines
    CKfolder                // sliced by sorted relative file names
};

extern DISTCOPY_API DistributionMode getDistributionMode(const char * name);        // throws on an unknown name
extern DISTCOPY_API const char * queryDistributionModeText(DistributionMode mode);
extern DISTCOPY_API const char * queryContentKindText(ContentKind kind);

#endif
