#include "source_bundle.h"

#include <gtest/gtest.h>
#include "error.h"

namespace runbox {
namespace {

TEST(IsSafeFileNameTest, AcceptsRelativeNames) {
  EXPECT_TRUE(IsSafeFileName("main.py"));
  EXPECT_TRUE(IsSafeFileName("pkg/module.py"));
  EXPECT_TRUE(IsSafeFileName("include/a b.h"));
  EXPECT_TRUE(IsSafeFileName(".hidden"));
  EXPECT_TRUE(IsSafeFileName("caf\xc3\xa9.js"));
}

TEST(IsSafeFileNameTest, RejectsEscapes) {
  EXPECT_FALSE(IsSafeFileName(""));
  EXPECT_FALSE(IsSafeFileName("/etc/passwd"));
  EXPECT_FALSE(IsSafeFileName("../main.py"));
  EXPECT_FALSE(IsSafeFileName("pkg/../../main.py"));
  EXPECT_FALSE(IsSafeFileName("./main.py"));
  EXPECT_FALSE(IsSafeFileName("pkg//main.py"));
  EXPECT_FALSE(IsSafeFileName("pkg/"));
  EXPECT_FALSE(IsSafeFileName("a\\b.py"));
  EXPECT_FALSE(IsSafeFileName(StringView("a\0b", 3)));
  EXPECT_FALSE(IsSafeFileName("line\nbreak.py"));
  EXPECT_FALSE(IsSafeFileName(String(256, 'a')));
}

SourceBundle MakeBundle() {
  SourceBundle bundle;
  bundle.language = Language::kPython;
  bundle.files = {{"main.py", "import util\n"}, {"util.py", "X = 1\n"}};
  bundle.entry_file = "main.py";
  return bundle;
}

TEST(ValidateBundleTest, AcceptsWellFormedBundle) {
  EXPECT_FALSE(ValidateBundle(MakeBundle()));
}

TEST(ValidateBundleTest, RequiresEntryInFileSet) {
  SourceBundle bundle = MakeBundle();
  bundle.entry_file = "missing.py";
  EXPECT_EQ(ValidateBundle(bundle), Errc::kInvalidBundle);
}

TEST(ValidateBundleTest, RejectsEmptyBundle) {
  SourceBundle bundle;
  bundle.entry_file = "main.py";
  EXPECT_EQ(ValidateBundle(bundle), Errc::kInvalidBundle);
}

TEST(ValidateBundleTest, RejectsDuplicateNames) {
  SourceBundle bundle = MakeBundle();
  bundle.files.push_back({"util.py", "X = 2\n"});
  EXPECT_EQ(ValidateBundle(bundle), Errc::kInvalidBundle);
}

TEST(ValidateBundleTest, RejectsTraversal) {
  SourceBundle bundle = MakeBundle();
  bundle.files.push_back({"../../escape.py", ""});
  EXPECT_EQ(ValidateBundle(bundle), Errc::kInvalidBundle);
}

TEST(FindFileTest, FindsByExactName) {
  SourceBundle bundle = MakeBundle();
  const SourceFile* file = FindFile(bundle.files, "util.py");
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->content, "X = 1\n");
  EXPECT_EQ(FindFile(bundle.files, "UTIL.py"), nullptr);
}

}  // namespace
}  // namespace runbox
