#include <mutex>
#include <string>

#include <gtest/gtest.h>

#include "base/xml.h"

namespace s3stream {
namespace base {
namespace tests {

namespace {
constexpr char INITIATE_RESPONSE[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<InitiateMultipartUploadResult "
    "xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
    "<Bucket>example-bucket</Bucket>"
    "<Key>example-object</Key>"
    "<UploadId>VXBsb2FkIElEIGZvciA2aWWpbmcncyBteS1tb3ZpZS5tMnRzIHVwbG9hZA"
    "</UploadId>"
    "</InitiateMultipartUploadResult>";

constexpr char COMPLETE_REQUEST[] =
    "<CompleteMultipartUpload>"
    "<Part><PartNumber>1</PartNumber><ETag>\"a54357aff0632cce46d942af68356b38"
    "\"</ETag></Part>"
    "<Part><PartNumber>2</PartNumber><ETag>\"0c78aef83f66abc1fa1e8477f296d394"
    "\"</ETag></Part>"
    "</CompleteMultipartUpload>";

constexpr char REQUEST_TIMEOUT_ERROR[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<Error><Code>RequestTimeout</Code>"
    "<Message>Your socket connection to the server was not read from or "
    "written to within the timeout period.</Message></Error>";

class Xml : public ::testing::Test {
 protected:
  void SetUp() override {
    static std::once_flag flag;
    std::call_once(flag, []() { XmlDocument::Init(); });
  }
};
}  // namespace

TEST_F(Xml, MatchOnNoXmlDeclaration) {
  auto doc = XmlDocument::Parse("<a><b></b></a>");
  ASSERT_TRUE(doc);
  EXPECT_TRUE(doc->Match("/a/b"));
}

TEST_F(Xml, FailOnMalformedXml) {
  EXPECT_FALSE(XmlDocument::Parse("<?xml version=\"1.0\"?><a><b></a>"));
}

TEST_F(Xml, FailOnEmptyInput) { EXPECT_FALSE(XmlDocument::Parse("")); }

TEST_F(Xml, MatchWithNamespacePrefix) {
  auto doc = XmlDocument::Parse(
      "<s3:a xmlns:s3=\"uri:something\"><s3:b><s3:c/></s3:b></s3:a>");
  ASSERT_TRUE(doc);
  EXPECT_TRUE(doc->Match("/a/b/c"));
}

TEST_F(Xml, FindUploadIdWithDefaultNamespace) {
  auto doc = XmlDocument::Parse(INITIATE_RESPONSE);
  ASSERT_TRUE(doc);

  std::string upload_id;
  ASSERT_EQ(0, doc->Find("/InitiateMultipartUploadResult/UploadId",
                         &upload_id));
  EXPECT_EQ("VXBsb2FkIElEIGZvciA2aWWpbmcncyBteS1tb3ZpZS5tMnRzIHVwbG9hZA",
            upload_id);
}

TEST_F(Xml, FindMissingSingleElement) {
  auto doc = XmlDocument::Parse(INITIATE_RESPONSE);
  ASSERT_TRUE(doc);

  std::string s = "unchanged";
  EXPECT_NE(0, doc->Find("/InitiateMultipartUploadResult/ETag", &s));
}

TEST_F(Xml, FindList) {
  auto doc = XmlDocument::Parse(COMPLETE_REQUEST);
  ASSERT_TRUE(doc);

  std::list<std::string> numbers;
  ASSERT_EQ(0, doc->Find("//PartNumber", &numbers));
  ASSERT_EQ(2ul, numbers.size());
  EXPECT_EQ("1", numbers.front());
  EXPECT_EQ("2", numbers.back());
}

TEST_F(Xml, FindMissingList) {
  auto doc = XmlDocument::Parse(COMPLETE_REQUEST);
  ASSERT_TRUE(doc);

  std::list<std::string> l;
  ASSERT_EQ(0, doc->Find("//thiselementdoesntexist", &l));
  EXPECT_TRUE(l.empty());
}

TEST_F(Xml, InvalidXPath) {
  auto doc = XmlDocument::Parse(COMPLETE_REQUEST);
  ASSERT_TRUE(doc);

  std::list<std::string> l;
  EXPECT_NE(0, doc->Find("//().", &l));
  EXPECT_TRUE(l.empty());
  EXPECT_FALSE(doc->Match("//()."));
}

TEST_F(Xml, ElementMap) {
  auto doc = XmlDocument::Parse(COMPLETE_REQUEST);
  ASSERT_TRUE(doc);

  XmlDocument::ElementMapList parts;
  ASSERT_EQ(0, doc->Find("/CompleteMultipartUpload/Part", &parts));
  ASSERT_EQ(2ul, parts.size());

  auto &first = parts.front();
  EXPECT_EQ(3ul, first.size());
  EXPECT_EQ("Part", first[XmlDocument::MAP_NAME_KEY]);
  EXPECT_EQ("1", first["PartNumber"]);
  EXPECT_EQ("\"a54357aff0632cce46d942af68356b38\"", first["ETag"]);

  auto &second = parts.back();
  EXPECT_EQ("2", second["PartNumber"]);
  EXPECT_EQ("\"0c78aef83f66abc1fa1e8477f296d394\"", second["ETag"]);
}

TEST_F(Xml, MatchErrorCode) {
  auto doc = XmlDocument::Parse(REQUEST_TIMEOUT_ERROR);
  ASSERT_TRUE(doc);

  EXPECT_TRUE(doc->Match("/Error/Code[text() = 'RequestTimeout']"));
  EXPECT_FALSE(doc->Match("/Error/Code[text() = 'InternalError']"));
}

}  // namespace tests
}  // namespace base
}  // namespace s3stream
