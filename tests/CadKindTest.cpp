#include <gtest/gtest.h>
#include "CadKind.hpp"
#include "stringUtils.hpp"
#include "Viewer/PreviewFetcher.hpp"

using namespace CadPreview;

TEST(CadKindTest, ClassifiesByExtensionCaseInsensitively) {
    EXPECT_EQ(classifyCadFile("part.STL").kind, CadKind::STL);
    EXPECT_EQ(classifyCadFile("dir/mesh.obj").kind, CadKind::OBJ);
    EXPECT_EQ(classifyCadFile("scene.Glb").kind, CadKind::GLB);
    EXPECT_EQ(classifyCadFile("bracket.step").kind, CadKind::STEP);
    EXPECT_EQ(classifyCadFile("bracket.STP").kind, CadKind::STEP);
    EXPECT_TRUE(classifyCadFile(" housing.stl ").ok);
}

TEST(CadKindTest, FailuresAreUnsupportedOrUnknown) {
    auto txt = classifyCadFile("readme.txt");
    EXPECT_FALSE(txt.ok);
    EXPECT_EQ(txt.failure, ClassifyFailure::Unsupported);
    EXPECT_EQ(txt.extension, "txt");

    EXPECT_EQ(classifyCadFile("noext").failure, ClassifyFailure::Unknown);
    EXPECT_EQ(classifyCadFile("").failure, ClassifyFailure::Unknown);
    EXPECT_EQ(classifyCadFile(".stl").failure, ClassifyFailure::Unknown);
    EXPECT_EQ(classifyCadFile("archive.stl.zip").failure, ClassifyFailure::Unsupported);
    EXPECT_STREQ(classifyFailureName(ClassifyFailure::Unsupported), "unsupported");
}

TEST(CadKindTest, ParsesKindTokensAndContentTypes) {
    EXPECT_EQ(parseCadKind(" STEP "), CadKind::STEP);
    EXPECT_EQ(parseCadKind("stp"), CadKind::STEP);
    EXPECT_FALSE(parseCadKind("fbx").has_value());
    EXPECT_FALSE(parseCadKind("").has_value());
    EXPECT_STREQ(cadKindName(CadKind::GLB), "glb");

    EXPECT_EQ(contentTypeFor(CadKind::STL), "model/stl");
    EXPECT_EQ(contentTypeFor(CadKind::GLB), "model/gltf-binary");
    EXPECT_EQ(contentTypeFor(CadKind::STEP), "application/step");
    EXPECT_EQ(contentTypeFor(CadKind::STEP, true), "model/stl");
}

TEST(ContentDispositionParseTest, ExtendedFilenameWins) {
    EXPECT_EQ(parseFilenameFromContentDisposition("inline; filename=\"part.stl\""), "part.stl");
    EXPECT_EQ(parseFilenameFromContentDisposition("attachment; filename=plain.obj"), "plain.obj");
    EXPECT_EQ(parseFilenameFromContentDisposition("inline; filename=\"a.stl\"; filename*=UTF-8''B%C3%BCgel%20v2.step"), "B\xC3\xBCgel v2.step");
    EXPECT_EQ(parseFilenameFromContentDisposition("inline; filename=\"semi;colon.glb\""), "semi;colon.glb");
    EXPECT_EQ(parseFilenameFromContentDisposition("inline"), "");
    EXPECT_EQ(parseFilenameFromContentDisposition(""), "");
}

TEST(StringUtilsTest, PathHelpers) {
    EXPECT_EQ(collapseSlashes("a//b///c"), "a/b/c");
    EXPECT_EQ(stripLeadingSlashes("///a/b"), "a/b");
    EXPECT_EQ(lastPathSegment("q/1/part.stl"), "part.stl");
    EXPECT_EQ(fileExtension("q.v2/part"), "");
    EXPECT_EQ(stripExtension("q/part.step"), "q/part");
    EXPECT_EQ(stripExtension("q.v2/part"), "q.v2/part");
    EXPECT_EQ(urlEncode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(urlEncodePath("quotes/q 1/p.stl"), "quotes/q%201/p.stl");
    EXPECT_EQ(urlDecode("a%20b+c%zz"), "a b+c%zz");
}
