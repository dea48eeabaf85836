#include "frnm.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

class RenameEngineTest : public TempDirTest {
protected:
    CapturedStream out_;
    RenameOptions opts_;
    RenameStats stats_;

    void SetUp() override {
        TempDirTest::SetUp();
        opts_.out = out_.get();
    }

    FrnmStatus run(const std::vector<std::string>& rel_paths, const std::string& sub = "_") {
        std::vector<std::string> entries;
        for (const auto& rel : rel_paths) entries.push_back(path(rel));
        return frnm_rename_entries(sub, entries, opts_, &stats_);
    }

    std::string notice(const std::string& from, const std::string& to) const {
        return path(from) + " ===> " + path(to);
    }
};

TEST_F(RenameEngineTest, RenamesFileAndPrintsNotice) {
    make_file("my file (2023).txt");

    FrnmStatus st = run({"my file (2023).txt"});

    ASSERT_TRUE(st.ok()) << st.message;
    EXPECT_TRUE(exists("my_file_2023.txt"));
    EXPECT_FALSE(exists("my file (2023).txt"));
    EXPECT_EQ(out_.lines(), std::vector<std::string>{notice("my file (2023).txt", "my_file_2023.txt")});
    EXPECT_EQ(stats_.renamed, 1u);
}

TEST_F(RenameEngineTest, QuietRunPrintsNothing) {
    make_file("a b.txt");
    opts_.verbose = false;

    ASSERT_TRUE(run({"a b.txt"}).ok());
    EXPECT_TRUE(exists("a_b.txt"));
    EXPECT_EQ(out_.str(), "");
}

TEST_F(RenameEngineTest, CleanNameIsNoop) {
    make_file("clean_name.txt");
    make_file("***.txt");
    make_file("a.txt");

    ASSERT_TRUE(run({"clean_name.txt", "***.txt", "a.txt"}).ok());
    EXPECT_TRUE(exists("clean_name.txt"));
    EXPECT_TRUE(exists("***.txt"));
    EXPECT_TRUE(exists("a.txt"));
    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(stats_.unchanged, 3u);
    EXPECT_EQ(stats_.renamed, 0u);
}

TEST_F(RenameEngineTest, DirectoryWithCustomChar) {
    make_dir("New Folder");

    ASSERT_TRUE(run({"New Folder"}, "-").ok());
    EXPECT_TRUE(exists("New-Folder"));
}

TEST_F(RenameEngineTest, CollisionLeavesEntryUntouched) {
    make_file("a_1.txt");
    make_file("a 1.txt");

    FrnmStatus st = run({"a 1.txt"});

    EXPECT_EQ(st.error, FrnmError::rename_collision);
    EXPECT_EQ(st.message, "File a_1.txt already exists.");
    EXPECT_TRUE(exists("a 1.txt"));
    EXPECT_TRUE(exists("a_1.txt"));
    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(stats_.collisions, 1u);
}

TEST_F(RenameEngineTest, CollisionNeverOverwritesSiblingContent) {
    make_file("a_1.txt");
    {
        std::ofstream f(path("a_1.txt"));
        f << "keep me";
    }
    make_file("a 1.txt");

    run({"a 1.txt"});

    std::ifstream f(path("a_1.txt"));
    std::stringstream ss;
    ss << f.rdbuf();
    EXPECT_EQ(ss.str(), "keep me");
}

TEST_F(RenameEngineTest, CollisionAbortsRemainingInputs) {
    make_file("a_1.txt");
    make_file("a 1.txt");
    make_file("b 2.txt");

    FrnmStatus st = run({"a 1.txt", "b 2.txt"});

    EXPECT_EQ(st.error, FrnmError::rename_collision);
    EXPECT_TRUE(exists("b 2.txt"));
}

TEST_F(RenameEngineTest, SuppressedCollisionContinues) {
    make_file("a_1.txt");
    make_file("a 1.txt");
    make_file("b 2.txt");
    opts_.suppress_errors = true;

    FrnmStatus st = run({"a 1.txt", "b 2.txt"});

    EXPECT_EQ(st.error, FrnmError::rename_collision);
    EXPECT_TRUE(exists("a 1.txt"));
    EXPECT_TRUE(exists("b_2.txt"));
    EXPECT_EQ(stats_.renamed, 1u);
    EXPECT_EQ(stats_.collisions, 1u);
}

TEST_F(RenameEngineTest, MissingPathFailsBeforeAnyRename) {
    make_file("good file.txt");

    FrnmStatus st = run({"good file.txt", "does not exist"});

    EXPECT_EQ(st.error, FrnmError::path_not_found);
    EXPECT_NE(st.message.find("does not exist"), std::string::npos);
    EXPECT_TRUE(exists("good file.txt"));
    EXPECT_EQ(out_.str(), "");
}

TEST_F(RenameEngineTest, SuppressedMissingPathSkipsOnlyThatInput) {
    make_file("good file.txt");
    opts_.suppress_errors = true;

    FrnmStatus st = run({"does not exist", "good file.txt"});

    EXPECT_EQ(st.error, FrnmError::path_not_found);
    EXPECT_TRUE(exists("good_file.txt"));
}

TEST_F(RenameEngineTest, InvalidCharTouchesNothing) {
    make_file("a b.txt");

    EXPECT_EQ(run({"a b.txt"}, "*").error, FrnmError::invalid_substitution_char);
    EXPECT_EQ(run({"a b.txt"}, "__").error, FrnmError::invalid_substitution_char);

    opts_.suppress_errors = true;
    EXPECT_EQ(run({"a b.txt"}, " ").error, FrnmError::invalid_substitution_char);
    EXPECT_TRUE(exists("a b.txt"));
}

TEST_F(RenameEngineTest, RecursiveRenamesChildBeforeParent) {
    make_dir("Parent Dir");
    make_file("Parent Dir/Child File.txt");
    opts_.recursive = true;

    ASSERT_TRUE(run({"Parent Dir"}).ok());

    EXPECT_TRUE(exists("Parent_Dir/Child_File.txt"));
    EXPECT_EQ(out_.lines(), (std::vector<std::string>{
        notice("Parent Dir/Child File.txt", "Parent Dir/Child_File.txt"),
        notice("Parent Dir", "Parent_Dir"),
    }));
}

TEST_F(RenameEngineTest, RecursiveHandlesNestedTree) {
    make_dir("top dir");
    make_dir("top dir/mid dir");
    make_dir("top dir/mid dir/leaf dir");
    make_file("top dir/mid dir/leaf dir/deep file.txt");
    make_file("top dir/mid dir/mid file.txt");
    make_file("top dir/top file.txt");
    opts_.recursive = true;

    ASSERT_TRUE(run({"top dir"}).ok());

    EXPECT_TRUE(exists("top_dir/mid_dir/leaf_dir/deep_file.txt"));
    EXPECT_TRUE(exists("top_dir/mid_dir/mid_file.txt"));
    EXPECT_TRUE(exists("top_dir/top_file.txt"));
    EXPECT_EQ(stats_.renamed, 6u);

    // A directory is only renamed after every line naming something inside it.
    auto lines = out_.lines();
    ASSERT_EQ(lines.size(), 6u);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string old_path = lines[i].substr(0, lines[i].find(" ===> "));
        for (size_t j = i + 1; j < lines.size(); ++j) {
            EXPECT_NE(lines[j].compare(0, old_path.size() + 1, old_path + "/"), 0)
                << lines[j] << " renamed after its ancestor " << old_path;
        }
    }
}

TEST_F(RenameEngineTest, NonRecursiveRenamesDirectoryOnly) {
    make_dir("outer dir");
    make_file("outer dir/inner file.txt");

    ASSERT_TRUE(run({"outer dir"}).ok());

    EXPECT_TRUE(exists("outer_dir/inner file.txt"));
}

TEST_F(RenameEngineTest, SymlinkedDirectoryIsRenamedButNotEntered) {
    make_dir("outside dir");
    make_file("outside dir/inner file.txt");
    make_dir("tree");
    ASSERT_EQ(symlink(path("outside dir").c_str(), path("tree/link dir").c_str()), 0);
    opts_.recursive = true;

    ASSERT_TRUE(run({"tree"}).ok());

    EXPECT_TRUE(exists("tree/link_dir"));
    EXPECT_TRUE(exists("outside dir/inner file.txt"));
}

TEST_F(RenameEngineTest, SpecialFilesAreSkipped) {
    make_dir("tree");
    ASSERT_EQ(mkfifo(path("tree/my fifo").c_str(), 0644), 0);
    ASSERT_EQ(symlink(path("nowhere").c_str(), path("tree/dead link").c_str()), 0);
    opts_.recursive = true;

    ASSERT_TRUE(run({"tree"}).ok());

    EXPECT_TRUE(exists("tree/my fifo"));
    EXPECT_TRUE(exists("tree/dead link"));
    EXPECT_EQ(stats_.skipped, 2u);
}

TEST_F(RenameEngineTest, DuplicateInputsAreProcessedOnce) {
    make_file("dup me.txt");

    FrnmStatus st = frnm_rename_entries("_", {path("dup me.txt"), root_ + "/./dup me.txt"}, opts_, &stats_);

    ASSERT_TRUE(st.ok()) << st.message;
    EXPECT_TRUE(exists("dup_me.txt"));
    EXPECT_EQ(stats_.renamed, 1u);
}

TEST_F(RenameEngineTest, InputInsideRenamedAncestorIsSkipped) {
    make_dir("a dir");
    make_file("a dir/b file.txt");

    FrnmStatus st = run({"a dir", "a dir/b file.txt"});

    ASSERT_TRUE(st.ok()) << st.message;
    EXPECT_EQ(stats_.renamed, 1u);
    EXPECT_EQ(stats_.skipped, 1u);
    EXPECT_TRUE(exists("a_dir/b file.txt"));
}

TEST_F(RenameEngineTest, RecursiveDirectoryFollowedByItsChildren) {
    make_dir("docs");
    make_file("docs/a b.txt");
    opts_.recursive = true;

    FrnmStatus st = run({"docs", "docs/a b.txt"});

    ASSERT_TRUE(st.ok()) << st.message;
    EXPECT_TRUE(exists("docs/a_b.txt"));
    EXPECT_FALSE(exists("docs/a b.txt"));
    EXPECT_EQ(stats_.renamed, 1u);
    EXPECT_EQ(stats_.unchanged, 1u);
    EXPECT_EQ(stats_.skipped, 1u);
    EXPECT_EQ(stats_.errors, 0u);
}

TEST_F(RenameEngineTest, SymlinkInputRenamesTarget) {
    make_file("real file.txt");
    ASSERT_EQ(symlink(path("real file.txt").c_str(), path("alias").c_str()), 0);

    ASSERT_TRUE(run({"alias"}).ok());

    EXPECT_TRUE(exists("real_file.txt"));
    EXPECT_TRUE(exists("alias"));
}

TEST_F(RenameEngineTest, AuditLogRecordsAttempts) {
    make_dir("work");
    make_file("work/ok file.txt");
    make_file("work/x_1.txt");
    make_file("work/x 1.txt");
    opts_.audit_log_path = path("audit.log");
    opts_.suppress_errors = true;

    run({"work/ok file.txt", "work/x 1.txt"});

    std::ifstream f(path("audit.log"));
    std::stringstream ss;
    ss << f.rdbuf();
    std::string audit = ss.str();

    EXPECT_NE(audit.find("RENAME: " + path("work/ok file.txt") + " -> " + path("work/ok_file.txt") + " SUCCESS"),
              std::string::npos);
    EXPECT_NE(audit.find(path("work/x_1.txt") + " FAILED (target exists)"), std::string::npos);
}

class CollectDescendantsTest : public TempDirTest {};

TEST_F(CollectDescendantsTest, EveryEntryPrecedesItsAncestors) {
    make_dir("r");
    make_dir("r/a");
    make_dir("r/a/b");
    make_file("r/a/b/f1");
    make_file("r/a/f2");
    make_dir("r/c");
    make_file("r/f3");

    auto children = frnm_collect_descendants(path("r"));

    ASSERT_EQ(children.size(), 6u);
    for (size_t i = 0; i < children.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            EXPECT_NE(children[i].compare(0, children[j].size() + 1, children[j] + "/"), 0)
                << children[i] << " listed after its ancestor " << children[j];
        }
    }
    EXPECT_EQ(std::count(children.begin(), children.end(), path("r")), 0);
}
