#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docsplit_cli/cli_handler.hpp"
#include "../../common/utilities_test.hpp"

namespace docsplit_cli {

class CliHandlerTest : public docsplit_tests::TempDirectoryTestBase {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "docsplit");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  nlohmann::json run(std::vector<std::string> args) {
    handler_.execute_command(parse(std::move(args)));
    return nlohmann::json::parse(out_.str());
  }

  std::ostringstream out_;
  std::ostringstream err_;
  CliHandler handler_{out_, err_};
};

TEST_F(CliHandlerTest, Parse_ChunkWithSeveralFiles) {
  auto options = parse({"chunk", "--file", "a.md", "-f", "b.md", "--no-enrich"});

  EXPECT_EQ(options.command, Command::Chunk);
  EXPECT_EQ(options.file_paths, (std::vector<std::string>{"a.md", "b.md"}));
  EXPECT_TRUE(options.no_enrich);
  EXPECT_TRUE(options.config_path.empty());
}

TEST_F(CliHandlerTest, Parse_AliasesAndHelp) {
  EXPECT_EQ(parse({"c", "-f", "a.md"}).command, Command::Chunk);
  EXPECT_EQ(parse({"s", "-f", "a.md"}).command, Command::Stats);
  EXPECT_EQ(parse({"b", "-f", "a.md", "-p", "3"}).command, Command::Boundary);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
  EXPECT_EQ(parse({}).command, Command::Help);
}

TEST_F(CliHandlerTest, Parse_BoundaryOptions) {
  auto options = parse({"boundary", "--file", "a.md", "--position", "120", "--window", "50"});

  EXPECT_EQ(options.position, 120u);
  EXPECT_EQ(options.window, 50u);
}

TEST_F(CliHandlerTest, Parse_RejectsBadInput) {
  EXPECT_THROW(parse({"explode"}), CliError);
  EXPECT_THROW(parse({"chunk", "--file", "a.md", "--bogus", "x"}), CliError);
  EXPECT_THROW(parse({"chunk", "--file"}), CliError);
  EXPECT_THROW(parse({"chunk"}), CliError);
  EXPECT_THROW(parse({"stats", "-f", "a.md", "-f", "b.md"}), CliError);
  EXPECT_THROW(parse({"boundary", "-f", "a.md"}), CliError);
  EXPECT_THROW(parse({"boundary", "-f", "a.md", "-p", "-4"}), CliError);
  EXPECT_THROW(parse({"boundary", "-f", "a.md", "-p", "12abc"}), CliError);
  EXPECT_THROW(parse({"chunk", "-f", "a.md", "-f", "b.md", "-d", "id"}), CliError);
}

TEST_F(CliHandlerTest, Chunk_SingleFilePrintsReport) {
  auto path = create_test_file("notes.md", "# Notes\n\nShort text.");

  auto report = run({"chunk", "--file", path.string()});

  EXPECT_EQ(report["document_id"], "notes");
  ASSERT_EQ(report["chunks"].size(), 1u);
  EXPECT_EQ(report["chunks"][0]["id"], "notes-chunk-0");
  EXPECT_EQ(report["statistics"]["total_chunks"], 1);
  EXPECT_NE(err_.str().find("Chunked"), std::string::npos);
}

TEST_F(CliHandlerTest, Chunk_DocumentIdOverride) {
  auto path = create_test_file("notes.md", "Short text.");

  auto report = run({"chunk", "--file", path.string(), "--document-id", "custom"});

  EXPECT_EQ(report["document_id"], "custom");
}

TEST_F(CliHandlerTest, Chunk_SeveralFilesPrintsArray) {
  auto first = create_test_file("one.md", "First document.");
  auto second = create_test_file("two.md", "Second document.");

  auto reports = run({"chunk", "-f", first.string(), "-f", second.string()});

  ASSERT_TRUE(reports.is_array());
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_EQ(reports[0]["document_id"], "one");
  EXPECT_EQ(reports[1]["document_id"], "two");
}

TEST_F(CliHandlerTest, Chunk_UsesConfigFile) {
  auto config = create_test_file(
      "config.json", R"({"chunking": {"max_chunk_size": 100, "metadata_overhead": 0, "overlap_percentage": 20}})");
  auto doc = create_test_file("plain.txt", std::string(500, 'a'));

  auto report = run({"chunk", "-f", doc.string(), "--config", config.string()});

  EXPECT_EQ(report["chunks"].size(), 6u);
  EXPECT_EQ(report["warnings"].size(), 5u);
}

TEST_F(CliHandlerTest, Stats_PrintsStatisticsOnly) {
  auto path = create_test_file("doc.md", "# A\n\nSome words here.");

  auto stats = run({"stats", "-f", path.string()});

  EXPECT_EQ(stats["document_id"], "doc");
  EXPECT_EQ(stats["statistics"]["total_chunks"], 1);
  EXPECT_EQ(stats["statistics"]["heading_count"], 1);
  EXPECT_FALSE(stats.contains("chunks"));
}

TEST_F(CliHandlerTest, Boundary_PrintsBestBoundary) {
  auto path = create_test_file("doc.md", "Some text. More words\n## Heading\nmore text");

  auto boundary = run({"boundary", "-f", path.string(), "-p", "20"});

  EXPECT_EQ(boundary["position"], 22);
  EXPECT_EQ(boundary["kind"], "section");
}

TEST_F(CliHandlerTest, Boundary_PositionPastEndThrows) {
  auto path = create_test_file("doc.md", "tiny");

  EXPECT_THROW(handler_.execute_command(parse({"boundary", "-f", path.string(), "-p", "99"})),
               CliError);
}

TEST_F(CliHandlerTest, MissingFileThrows) {
  auto missing = (test_dir_ / "missing.md").string();

  EXPECT_THROW(handler_.execute_command(parse({"chunk", "-f", missing})), CliError);
}

TEST_F(CliHandlerTest, HelpPrintsUsage) {
  handler_.execute_command(parse({"help"}));

  EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
  EXPECT_NE(out_.str().find("docsplit chunk"), std::string::npos);
}

}  // namespace docsplit_cli
