#include "optimizer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <stdexcept>

using namespace webpify;
using webpify::test::FakeTranscoder;
using webpify::test::TempDir;
using webpify::test::read_file;
using webpify::test::write_file;

namespace {

// kleiner beispiel-baum: bilder, seiten, und ein excluded ordner
void make_site(const TempDir& dir) {
    write_file(dir / "img" / "photo.jpg", std::string(400, 'j'));
    write_file(dir / "img" / "logo.png", std::string(200, 'p'));
    write_file(dir / "index.html", R"(<img src="img/photo.jpg"><link href="css/site.css">)");
    write_file(dir / "css" / "site.css", "header { background: url('../img/logo.png'); }");
    write_file(dir / "README.md", "![Logo](img/logo.png)\n");
    write_file(dir / "node_modules" / "lib" / "photo.jpg", "x");
    write_file(dir / "node_modules" / "lib" / "demo.html", R"(<img src="photo.jpg">)");
}

std::map<std::string, std::string> snapshot(const fs::path& root) {
    std::map<std::string, std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files[entry.path().lexically_relative(root).generic_string()] = read_file(entry.path());
        }
    }
    return files;
}

struct Harness {
    FakeTranscoder transcoder;
    std::ostringstream out;
    std::ostringstream err;
    Optimizer optimizer{transcoder, out, err};
};

} // namespace

TEST(OptimizerTest, FullRunConvertsAndRewrites) {
    TempDir dir;
    make_site(dir);
    Harness h;
    OptimizerOptions options;
    options.root = dir.path();

    auto stats = h.optimizer.run(options);

    EXPECT_EQ(stats.images_found, 2u);
    EXPECT_EQ(stats.images_converted, 2u);
    EXPECT_EQ(stats.images_failed, 0u);
    EXPECT_EQ(stats.original_bytes, 600u);
    EXPECT_EQ(stats.code_files, 3u);
    EXPECT_EQ(stats.files_updated, 3u);
    EXPECT_EQ(stats.replacements, 3u);
    EXPECT_EQ(stats.originals_deleted, 0u);

    EXPECT_TRUE(fs::exists(dir / "img" / "photo.webp"));
    EXPECT_TRUE(fs::exists(dir / "img" / "photo.jpg"));
    EXPECT_EQ(read_file(dir / "index.html"), R"(<img src="img/photo.webp"><link href="css/site.css">)");
    EXPECT_EQ(read_file(dir / "css" / "site.css"), "header { background: url('../img/logo.webp'); }");
    EXPECT_EQ(read_file(dir / "README.md"), "![Logo](img/logo.webp)\n");

    // excluded ordner bleibt unangetastet
    EXPECT_FALSE(fs::exists(dir / "node_modules" / "lib" / "photo.webp"));
    EXPECT_EQ(read_file(dir / "node_modules" / "lib" / "demo.html"), R"(<img src="photo.jpg">)");
    EXPECT_FALSE(stats.has_failures());
}

TEST(OptimizerTest, DryRunTouchesNothing) {
    TempDir dir;
    make_site(dir);
    const auto before = snapshot(dir.path());
    Harness h;
    OptimizerOptions options;
    options.root = dir.path();
    options.dry_run = true;
    options.backup = true;
    options.delete_originals = true;

    auto stats = h.optimizer.run(options);

    EXPECT_EQ(snapshot(dir.path()), before);
    EXPECT_TRUE(h.transcoder.calls.empty());
    EXPECT_EQ(stats.images_converted, 2u);
    EXPECT_EQ(stats.replacements, 3u);
    EXPECT_EQ(stats.files_updated, 3u);
    EXPECT_EQ(stats.originals_deleted, 0u);
    EXPECT_NE(h.out.str().find("[DRY RUN]"), std::string::npos);
    EXPECT_NE(h.out.str().find("This was a dry run"), std::string::npos);
}

TEST(OptimizerTest, DryRunPredictsRealRun) {
    TempDir planned_dir, real_dir;
    make_site(planned_dir);
    make_site(real_dir);

    Harness planned, real;
    OptimizerOptions options;
    options.root = planned_dir.path();
    options.dry_run = true;
    auto plan = planned.optimizer.run(options);

    options.root = real_dir.path();
    options.dry_run = false;
    auto done = real.optimizer.run(options);

    EXPECT_EQ(plan.images_converted, done.images_converted);
    EXPECT_EQ(plan.replacements, done.replacements);
    EXPECT_EQ(plan.files_updated, done.files_updated);
    EXPECT_EQ(plan.original_bytes, done.original_bytes);
}

TEST(OptimizerTest, SecondRunMakesNoFurtherReplacements) {
    TempDir dir;
    make_site(dir);
    OptimizerOptions options;
    options.root = dir.path();

    Harness first;
    first.optimizer.run(options);
    const auto html = read_file(dir / "index.html");

    // originale sind noch da, werden nochmal konvertiert, aber text hat schon .webp
    Harness second;
    auto stats = second.optimizer.run(options);
    EXPECT_EQ(stats.replacements, 0u);
    EXPECT_EQ(read_file(dir / "index.html"), html);
}

TEST(OptimizerTest, DeletesOriginalsOnlyWhenRequested) {
    TempDir dir;
    make_site(dir);
    Harness h;
    OptimizerOptions options;
    options.root = dir.path();
    options.delete_originals = true;

    auto stats = h.optimizer.run(options);

    EXPECT_EQ(stats.originals_deleted, 2u);
    EXPECT_FALSE(fs::exists(dir / "img" / "photo.jpg"));
    EXPECT_FALSE(fs::exists(dir / "img" / "logo.png"));
    EXPECT_TRUE(fs::exists(dir / "img" / "photo.webp"));
    EXPECT_TRUE(fs::exists(dir / "node_modules" / "lib" / "photo.jpg"));
}

TEST(OptimizerTest, FailedImagesAreNotDeletedOrMapped) {
    TempDir dir;
    make_site(dir);
    Harness h;
    h.transcoder.fail_names = {"logo.png"};
    OptimizerOptions options;
    options.root = dir.path();
    options.delete_originals = true;

    auto stats = h.optimizer.run(options);

    EXPECT_EQ(stats.images_failed, 1u);
    EXPECT_TRUE(stats.has_failures());
    EXPECT_TRUE(fs::exists(dir / "img" / "logo.png"));
    EXPECT_FALSE(fs::exists(dir / "img" / "photo.jpg"));
    EXPECT_EQ(read_file(dir / "README.md"), "![Logo](img/logo.png)\n");
    EXPECT_NE(h.err.str().find("logo.png"), std::string::npos);
}

TEST(OptimizerTest, MissingConvertedFileBlocksDeletion) {
    TempDir dir;
    write_file(dir / "a.png", "a");
    write_file(dir / "b.png", "b");
    write_file(dir / "b.webp", "converted");
    Harness h;

    auto result = h.optimizer.delete_originals({{dir / "a.png", dir / "a.webp"}, {dir / "b.png", dir / "b.webp"}}, false);

    EXPECT_EQ(result.first, 1u);
    EXPECT_EQ(result.second, 0u);
    EXPECT_TRUE(fs::exists(dir / "a.png"));
    EXPECT_FALSE(fs::exists(dir / "b.png"));
}

TEST(OptimizerTest, DeletionFailureIsReportedAndOthersContinue) {
    TempDir dir;
    write_file(dir / "b.png", "b");
    write_file(dir / "b.webp", "converted");
    write_file(dir / "gone.webp", "converted");
    Harness h;

    // gone.png existiert nicht mehr, remove schlaegt fehl
    auto result = h.optimizer.delete_originals({{dir / "gone.png", dir / "gone.webp"}, {dir / "b.png", dir / "b.webp"}}, false);

    EXPECT_EQ(result.first, 1u);
    EXPECT_EQ(result.second, 1u);
    EXPECT_FALSE(fs::exists(dir / "b.png"));
    EXPECT_NE(h.err.str().find("gone.png"), std::string::npos);
}

TEST(OptimizerTest, NoImagesIsNotAnError) {
    TempDir dir;
    write_file(dir / "index.html", "<p>hi</p>");
    Harness h;
    OptimizerOptions options;
    options.root = dir.path();

    auto stats = h.optimizer.run(options);

    EXPECT_EQ(stats.images_found, 0u);
    EXPECT_FALSE(stats.has_failures());
    EXPECT_NE(h.out.str().find("No JPG, JPEG, or PNG images found."), std::string::npos);
}

TEST(OptimizerTest, NoCodeFilesIsNotAnError) {
    TempDir dir;
    write_file(dir / "a.png", "a");
    Harness h;
    OptimizerOptions options;
    options.root = dir.path();

    auto stats = h.optimizer.run(options);

    EXPECT_EQ(stats.images_converted, 1u);
    EXPECT_EQ(stats.code_files, 0u);
    EXPECT_NE(h.out.str().find("No HTML, PHP, or other code files found."), std::string::npos);
}

TEST(OptimizerTest, RejectsBadQualityAndMissingRootBeforeWork) {
    TempDir dir;
    write_file(dir / "a.png", "a");
    Harness h;
    OptimizerOptions options;
    options.root = dir.path();

    options.quality = 0;
    EXPECT_THROW(h.optimizer.run(options), std::invalid_argument);
    options.quality = 101;
    EXPECT_THROW(h.optimizer.run(options), std::invalid_argument);

    options.quality = 85;
    options.root = dir / "does-not-exist";
    EXPECT_THROW(h.optimizer.run(options), std::invalid_argument);

    options.root = dir / "a.png";
    EXPECT_THROW(h.optimizer.run(options), std::invalid_argument);

    EXPECT_TRUE(h.transcoder.calls.empty());
    EXPECT_FALSE(fs::exists(dir / "a.webp"));
}

TEST(OptimizerTest, QualityBoundsAreInclusive) {
    EXPECT_FALSE(is_valid_quality(0));
    EXPECT_TRUE(is_valid_quality(1));
    EXPECT_TRUE(is_valid_quality(100));
    EXPECT_FALSE(is_valid_quality(101));
}

TEST(OptimizerTest, RealTranscoderEndToEnd) {
    TempDir dir;
    ASSERT_TRUE(test::write_png(dir / "assets" / "hero.png", 48, 32, 4));
    ASSERT_TRUE(test::write_jpg(dir / "assets" / "team.jpg", 48, 32));
    write_file(dir / "page.php", R"(<?php ?><img src="/assets/hero.png"><img src='assets/team.jpg'>)");

    WebPTranscoder transcoder;
    std::ostringstream out, err;
    Optimizer optimizer(transcoder, out, err);
    OptimizerOptions options;
    options.root = dir.path();
    options.backup = true;
    options.jobs = 2;

    auto stats = optimizer.run(options);

    EXPECT_EQ(stats.images_converted, 2u) << err.str();
    EXPECT_GT(stats.new_bytes, 0u);
    EXPECT_TRUE(fs::exists(dir / "assets" / "hero.webp"));
    EXPECT_TRUE(fs::exists(dir / "assets" / "team.jpg.backup"));
    EXPECT_EQ(read_file(dir / "page.php"), R"(<?php ?><img src="/assets/hero.webp"><img src='assets/team.webp'>)");
}

TEST(FormatSizeTest, HumanReadable) {
    EXPECT_EQ(format_size(512), "512.0 B");
    EXPECT_EQ(format_size(1536), "1.5 KB");
    EXPECT_EQ(format_size(5ull * 1024 * 1024), "5.0 MB");
}
