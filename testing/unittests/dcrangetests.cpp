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

#include "unittests.hpp"
#include "dcerror.hpp"
#include "dcrange.hpp"
#include "dctesthelpers.hpp"

static const char * fourteenLines = "l0\nl1\nl2\nl3\nl4\nl5\nl6\nl7\nl8\nl9\nl10\nl11\nl12\nl13\n";

class DistCopyRangeTest : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(DistCopyRangeTest);
        CPPUNIT_TEST(testFolderSelection);
        CPPUNIT_TEST(testListingOrder);
        CPPUNIT_TEST(testFileSelection);
        CPPUNIT_TEST(testRangeErrors);
        CPPUNIT_TEST(testUnresolvable);
        CPPUNIT_TEST(testLineSlicing);
    CPPUNIT_TEST_SUITE_END();

protected:
    void testFolderSelection()
    {
        MemoryCluster cluster;
        cluster.addFile("athena1", "/data/folder/b.txt", "b");
        cluster.addFile("athena1", "/data/folder/a.txt", "a");
        cluster.addFile("athena1", "/data/folder/c.txt", "c");
        CMemoryContentInspector inspector(cluster);
        inspector.setReverseListing(true);

        Holding source("athena1", "/data/folder");
        ContentExtent extent;
        resolveExtent(extent, inspector, source);
        CPPUNIT_ASSERT_EQUAL((int)CKfolder, (int)extent.kind);
        CPPUNIT_ASSERT_EQUAL((unsigned __int64)3, extent.size);
        CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), extent.files[0]);
        CPPUNIT_ASSERT_EQUAL(std::string("c.txt"), extent.files[2]);

        ContentSelection selection;
        resolveSelection(selection, extent, source, Holding("athena2", "/data/part", 0, 2));
        CPPUNIT_ASSERT(!selection.whole);
        CPPUNIT_ASSERT_EQUAL((size_t)2, selection.files.size());
        CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), selection.files[0]);
        CPPUNIT_ASSERT_EQUAL(std::string("b.txt"), selection.files[1]);
        StringBuffer s;
        CPPUNIT_ASSERT_EQUAL_STR("files [0,2)", selection.describe(s).str());
    }

    void testListingOrder()
    {
        //Byte order of the full relative path: '.' sorts before '/'
        std::vector<std::string> files = { "sub/z.txt", "b.txt", "sub.txt", "A.txt", "a.txt" };
        sortFolderListing(files);
        CPPUNIT_ASSERT_EQUAL(std::string("A.txt"), files[0]);
        CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), files[1]);
        CPPUNIT_ASSERT_EQUAL(std::string("b.txt"), files[2]);
        CPPUNIT_ASSERT_EQUAL(std::string("sub.txt"), files[3]);
        CPPUNIT_ASSERT_EQUAL(std::string("sub/z.txt"), files[4]);

        MemoryCluster cluster;
        cluster.addFile("athena1", "/data/f/sub/z.txt", "z");
        cluster.addFile("athena1", "/data/f/b.txt", "b");
        cluster.addFile("athena1", "/data/f/sub.txt", "s");
        CMemoryContentInspector forward(cluster);
        CMemoryContentInspector backward(cluster);
        backward.setReverseListing(true);

        ContentExtent extent1, extent2;
        resolveExtent(extent1, forward, Holding("athena1", "/data/f/"));
        resolveExtent(extent2, backward, Holding("athena1", "/data/f/"));
        CPPUNIT_ASSERT(extent1.files == extent2.files);
    }

    void testFileSelection()
    {
        MemoryCluster cluster;
        cluster.addFile("athena1", "/data/in.txt", fourteenLines);
        CMemoryContentInspector inspector(cluster);

        Holding source("athena1", "/data/in.txt");
        ContentExtent extent;
        resolveExtent(extent, inspector, source);
        CPPUNIT_ASSERT_EQUAL((int)CKfile, (int)extent.kind);
        CPPUNIT_ASSERT_EQUAL((unsigned __int64)14, extent.size);
        CPPUNIT_ASSERT_EQUAL_STR("lines", extent.queryUnitText());

        ContentSelection selection;
        resolveSelection(selection, extent, source, Holding("athena2", "/data/out.txt", 12, 14));
        CPPUNIT_ASSERT(!selection.whole);
        CPPUNIT_ASSERT_EQUAL((unsigned __int64)12, selection.from);
        CPPUNIT_ASSERT_EQUAL((unsigned __int64)14, selection.to);
        CPPUNIT_ASSERT(selection.files.empty());

        resolveSelection(selection, extent, source, Holding("athena2", "/data/out.txt"));
        CPPUNIT_ASSERT(selection.whole);
        CPPUNIT_ASSERT_EQUAL((unsigned __int64)14, selection.to);
        StringBuffer s;
        CPPUNIT_ASSERT_EQUAL_STR("all", selection.describe(s).str());
    }

    void testRangeErrors()
    {
        ContentExtent extent;
        extent.kind = CKfile;
        extent.size = 14;
        Holding source("athena1", "/data/in.txt");
        ContentSelection selection;

        CPPUNIT_ASSERT_EQUAL(DCERR_RangeExceedsExtent, captureErrorCode([&]() { resolveSelection(selection, extent, source, Holding("athena2", "/data/out.txt", 10, 20)); }));
        CPPUNIT_ASSERT_EQUAL(DCERR_EmptyRange, captureErrorCode([&]() { resolveSelection(selection, extent, source, Holding("athena2", "/data/out.txt", 5, 5)); }));
        CPPUNIT_ASSERT_EQUAL(0, captureErrorCode([&]() { resolveSelection(selection, extent, source, Holding("athena2", "/data/out.txt", 0, 14)); }));
    }

    void testUnresolvable()
    {
        MemoryCluster cluster;
        cluster.addFile("athena1", "/data/folder/a.txt", "a");
        CMemoryContentInspector inspector(cluster);
        ContentExtent extent;

        int code = captureErrorCode([&]() { resolveExtent(extent, inspector, Holding("athena1", "/data/missing")); });
        CPPUNIT_ASSERT_EQUAL(DCERR_CouldNotInspect, code);
        CPPUNIT_ASSERT(isDistCopyResolutionError(code));

        inspector.failNode("athena1");
        code = captureErrorCode([&]() { resolveExtent(extent, inspector, Holding("athena1", "/data/folder")); });
        CPPUNIT_ASSERT(isDistCopyResolutionError(code));
    }

    void testLineSlicing()
    {
        CPPUNIT_ASSERT_EQUAL(std::string("l2\nl3\n"), sliceLines(fourteenLines, 2, 4));
        CPPUNIT_ASSERT_EQUAL(std::string(fourteenLines), sliceLines(fourteenLines, 0, 14));
        CPPUNIT_ASSERT_EQUAL((unsigned __int64)3, countContentLines("a\nb\nc\nd"));
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION( DistCopyRangeTest );
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION( DistCopyRangeTest, "DistCopyRange" );

#endif
