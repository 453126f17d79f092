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

#ifndef DCERROR_HPP
#define DCERROR_HPP

#include "jexcept.hpp"

//Configuration errors - detected while compiling a plan, nothing has been executed
#define ERR_DC_CONFIG_FIRST                     8400
#define ERR_DC_CONFIG_LAST                      8439

#define DCERR_CouldNotReadConfig                8400
#define DCERR_MissingConfigColumn               8401
#define DCERR_MalformedRow                      8402
#define DCERR_UnknownDirection                  8403
#define DCERR_EmptyNode                         8404
#define DCERR_EmptyPath                         8405
#define DCERR_UnsafePath                        8406
#define DCERR_InvalidRangeValue                 8407
#define DCERR_IncompleteRange                   8408
#define DCERR_EmptyRange                        8409
#define DCERR_RangeExceedsExtent                8410
#define DCERR_OverlappingRanges                 8411
#define DCERR_MissingRange                      8412
#define DCERR_NoSources                         8413
#define DCERR_NoDestinations                    8414
#define DCERR_GatherNeedsOneTarget              8415
#define DCERR_DuplicateDestination              8416
#define DCERR_CopyFileOntoSelf                  8417
#define DCERR_UnknownMode                       8418
#define DCERR_MixedSourceKinds                  8419
#define DCERR_UnsafeNode                        8420
#define DCERR_MixedContributorKinds             8421

//Resolution errors - the extent of some content could not be determined
#define ERR_DC_RESOLVE_FIRST                    8440
#define ERR_DC_RESOLVE_LAST                     8459

#define DCERR_CouldNotInspect                   8440
#define DCERR_CouldNotListFolder                8441
#define DCERR_CouldNotCountLines                8442

//Transfer errors - raised while a plan is executing
#define ERR_DC_TRANSFER_FIRST                   8460
#define ERR_DC_TRANSFER_LAST                    8479

#define DCERR_CopyFailed                        8460
#define DCERR_CommitFailed                      8461
#define DCERR_RoundFailed                       8462
#define DCERR_CommandFailed                     8463

//Command line errors
#define ERR_DC_SYNTAX_FIRST                     8480
#define ERR_DC_SYNTAX_LAST                      8489

#define DCERR_InvalidCommandSyntax              8480
#define DCERR_TooFewArguments                   8481
#define DCERR_InvalidArgument                   8482


//---- Text for all errors (make it easy to internationalise) ---------------------------

#define DCERR_CouldNotReadConfig_Text           "Could not read distribution config %s"
#define DCERR_MissingConfigColumn_Text          "Distribution config does not have a '%s' column"
#define DCERR_MalformedRow_Text                 "Malformed row %u in distribution config (%u fields, expected %u)"
#define DCERR_UnknownDirection_Text             "Unknown direction '%s' in row %u (expected source or destination)"
#define DCERR_EmptyNode_Text                    "Row %u does not name a node"
#define DCERR_EmptyPath_Text                    "Row %u does not name a path"
#define DCERR_UnsafePath_Text                   "Path '%s' in row %u contains whitespace or shell metacharacters"
#define DCERR_InvalidRangeValue_Text            "Invalid %s value '%s' in row %u"
#define DCERR_IncompleteRange_Text              "Row %u supplies only one of from/to"
#define DCERR_EmptyRange_Text                   "Empty range [%" I64F "u,%" I64F "u) for %s"
#define DCERR_RangeExceedsExtent_Text           "Range [%" I64F "u,%" I64F "u) for %s exceeds the %" I64F "u %s of %s"
#define DCERR_OverlappingRanges_Text            "Range of %s overlaps range of %s"
#define DCERR_MissingRange_Text                 "Scatter destination %s does not specify a range"
#define DCERR_NoSources_Text                    "There should be at least one source in the configuration"
#define DCERR_NoDestinations_Text               "There should be at least one destination in the configuration"
#define DCERR_GatherNeedsOneTarget_Text         "There should be exactly one source in a gather configuration (%u supplied)"
#define DCERR_DuplicateDestination_Text         "Destination node %s is listed more than once (%s)"
#define DCERR_CopyFileOntoSelf_Text             "Trying to gather a file (%s) onto itself"
#define DCERR_UnknownMode_Text                  "Unknown distribution mode '%s' (expected broadcast, scatter or gather)"
#define DCERR_MixedSourceKinds_Text             "Source %s is a %s but source %s is a %s"
#define DCERR_UnsafeNode_Text                   "Node '%s' in row %u is not a valid host name"
#define DCERR_MixedContributorKinds_Text        "Contributor %s is a %s but contributor %s is a %s"

#define DCERR_CouldNotInspect_Text              "Could not determine whether %s is a file or a folder"
#define DCERR_CouldNotListFolder_Text           "Error during listing files in source folder %s"
#define DCERR_CouldNotCountLines_Text           "Could not count the lines of %s"

#define DCERR_CopyFailed_Text                   "Round %u edge %u: copy %s -> %s failed: %s"
#define DCERR_CommitFailed_Text                 "Round %u edge %u: writing chunk into %s failed: %s"
#define DCERR_RoundFailed_Text                  "Round %u: %u of %u transfers failed"
#define DCERR_CommandFailed_Text                "Command failed with code %u: %s"

#define DCERR_InvalidCommandSyntax_Text         "Invalid command syntax"
#define DCERR_TooFewArguments_Text              "Please specify %s"
#define DCERR_InvalidArgument_Text              "Invalid value '%s' for %s"

#define throwDcError(x)                         throw MakeStringException(x, x##_Text)
#define throwDcError1(x,a)                      throw MakeStringException(x, x##_Text, a)
#define throwDcError2(x,a,b)                    throw MakeStringException(x, x##_Text, a, b)
#define throwDcError3(x,a,b,c)                  throw MakeStringException(x, x##_Text, a, b, c)
#define throwDcError4(x,a,b,c,d)                throw MakeStringException(x, x##_Text, a, b, c, d)

inline bool isDistCopyConfigError(int code)     { return (code >= ERR_DC_CONFIG_FIRST) && (code <= ERR_DC_CONFIG_LAST); }
inline bool isDistCopyResolutionError(int code) { return (code >= ERR_DC_RESOLVE_FIRST) && (code <= ERR_DC_RESOLVE_LAST); }
inline bool isDistCopyTransferError(int code)   { return (code >= ERR_DC_TRANSFER_FIRST) && (code <= ERR_DC_TRANSFER_LAST); }
inline bool isDistCopySyntaxError(int code)     { return (code >= ERR_DC_SYNTAX_FIRST) && (code <= ERR_DC_SYNTAX_LAST); }

//Process exit status for an error code. The shell only sees the low byte of a status, so codes are mapped onto a class.
#define DCEXIT_Success                          0
#define DCEXIT_Other                            1
#define DCEXIT_Config                           2
#define DCEXIT_Resolution                       3
#define DCEXIT_Transfer                         4
#define DCEXIT_Syntax                           5

inline int getDistCopyExitStatus(int code)
{
    if (code == 0)
        return DCEXIT_Success;
    if (isDistCopyConfigError(code))
        return DCEXIT_Config;
    if (isDistCopyResolutionError(code))
        return DCEXIT_Resolution;
    if (isDistCopyTransferError(code))
        return DCEXIT_Transfer;
    if (isDistCopySyntaxError(code))
        return DCEXIT_Syntax;
    return DCEXIT_Other;
}

#endif
