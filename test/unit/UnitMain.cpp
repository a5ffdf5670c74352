//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runParserTests();
bool runDirectiveModelTests();
bool runIRBuilderTests();
bool runValidatorTests();
bool runNamingPolicyTests();
bool runMirrorIndexTests();
bool runArchiveEmitterTests();
bool runDeserializeEmitterTests();
bool runEmitCommonTests();
bool runCppAdapterEmitterTests();
bool runMappingTableJsonTests();
bool runToolConfigTests();

int main()
{
    bool ok = true;
    ok      = runParserTests() && ok;
    ok      = runDirectiveModelTests() && ok;
    ok      = runIRBuilderTests() && ok;
    ok      = runValidatorTests() && ok;
    ok      = runNamingPolicyTests() && ok;
    ok      = runMirrorIndexTests() && ok;
    ok      = runArchiveEmitterTests() && ok;
    ok      = runDeserializeEmitterTests() && ok;
    ok      = runEmitCommonTests() && ok;
    ok      = runCppAdapterEmitterTests() && ok;
    ok      = runMappingTableJsonTests() && ok;
    ok      = runToolConfigTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
