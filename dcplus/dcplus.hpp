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

#ifndef _DCPLUS_HPP__
#define _DCPLUS_HPP__

#include "jliball.hpp"
#include "distcopy.hpp"

class CDistCopyHelper : public CInterface, implements IInterface
{
public:
    IMPLEMENT_IINTERFACE

    CDistCopyHelper(IProperties * _globals);

    int doit();

private:
    IPropertyTree * createOptions();
    int distribute(DistributionMode mode);

    void info(const char *format, ...) __attribute__((format(printf, 2, 3)));
    void error(const char *format, ...) __attribute__((format(printf, 2, 3)));
    void exc(const IMultiException &e, const char *title);

    Owned<IProperties> globals;
};

#endif
