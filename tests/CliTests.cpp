#include "LiteTest.hpp"

#include "cli/CommandLineInterface.hpp"

#include <fstream>
#include <vector>

using namespace osmprint;

namespace {

// Owns argv storage for one parse_arguments() call
struct Args {
  std::vector<std::string> storage;
  std::vector<char*> pointers;

  Args(std::initializer_list<std::string> args) : storage(args)
  {
    storage.insert(storage.begin(), "osm-print");
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
    pointers.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage.size()); }
  char** argv() { return pointers.data(); }
};

bool Parse(CommandLineInterface& cli, Args&& args)
{
  return cli.parse_arguments(args.argc(), args.argv());
}

void WriteText(const std::filesystem::path& path, const std::string& text)
{
  std::ofstream out(path);
  out << text;
}

} // namespace

static void TestParseBounds()
{
  const auto bounds = CommandLineInterface::parse_bounds("47.60,-122.34,47.62,-122.32");
  ASSERT_TRUE(bounds.has_value());
  EXPECT_NEAR(bounds->south, 47.60, 1e-12);
  EXPECT_NEAR(bounds->west, -122.34, 1e-12);
  EXPECT_NEAR(bounds->north, 47.62, 1e-12);
  EXPECT_NEAR(bounds->east, -122.32, 1e-12);

  EXPECT_TRUE(CommandLineInterface::parse_bounds(" 1, 2, 3, 4 ").has_value());
  EXPECT_FALSE(CommandLineInterface::parse_bounds("1,2,3").has_value());
  EXPECT_FALSE(CommandLineInterface::parse_bounds("1,2,3,4,5").has_value());
  EXPECT_FALSE(CommandLineInterface::parse_bounds("1,2,north,4").has_value());
  EXPECT_FALSE(CommandLineInterface::parse_bounds("1,2,3,4x").has_value());
  EXPECT_FALSE(CommandLineInterface::parse_bounds("").has_value());
}

static void TestParseFormats()
{
  const auto formats = CommandLineInterface::parse_formats(" 3MF, stl ,3mf,,STL");
  ASSERT_TRUE(formats.size() == 2);
  EXPECT_EQ(formats[0], std::string("3mf"));
  EXPECT_EQ(formats[1], std::string("stl"));

  EXPECT_TRUE(CommandLineInterface::parse_formats("").empty());
  EXPECT_TRUE(CommandLineInterface::parse_formats(" , ").empty());
}

static void TestFullCommandLine()
{
  CommandLineInterface cli;
  ASSERT_TRUE(Parse(cli, {"--input", "map.json", "--bounds", "0,0,0.01,0.01", "--target-size", "150",
                          "--output-formats", "3MF,stl", "--base-name", "block", "--output-dir", "prints/",
                          "--vertex-colors", "--stl-ascii", "--silent"}));

  const PrintConfig& config = cli.get_config();
  EXPECT_EQ(config.input_file, std::string("map.json"));
  ASSERT_TRUE(config.bounds.has_value());
  EXPECT_NEAR(config.bounds->north, 0.01, 1e-12);
  EXPECT_NEAR(config.target_size_mm, 150.0, 1e-12);
  EXPECT_EQ(config.output_formats.size(), static_cast<size_t>(2));
  EXPECT_EQ(config.base_name, std::string("block"));
  EXPECT_EQ(config.output_directory, std::string("prints"));
  EXPECT_TRUE(config.vertex_colors);
  EXPECT_FALSE(config.stl_binary);
  EXPECT_EQ(config.log_level, 1);
  EXPECT_FALSE(cli.is_dry_run());
  EXPECT_EQ(cli.exit_code(), 0);
}

static void TestPositionalInputAndEdges()
{
  CommandLineInterface positional;
  ASSERT_TRUE(Parse(positional, {"map.json", "--silent", "--dry-run"}));
  EXPECT_EQ(positional.get_config().input_file, std::string("map.json"));
  EXPECT_FALSE(positional.get_config().bounds.has_value());
  EXPECT_TRUE(positional.is_dry_run());

  CommandLineInterface edges;
  ASSERT_TRUE(Parse(edges, {"-i", "map.json", "--south", "-1", "--west", "-2", "--north", "1", "--east", "2", "-s"}));
  ASSERT_TRUE(edges.get_config().bounds.has_value());
  EXPECT_NEAR(edges.get_config().bounds->south, -1.0, 1e-12);
  EXPECT_NEAR(edges.get_config().bounds->east, 2.0, 1e-12);

  // A single edge adjusts --bounds
  CommandLineInterface adjusted;
  ASSERT_TRUE(Parse(adjusted, {"-i", "map.json", "--bounds", "0,0,1,1", "--north", "2", "-s"}));
  EXPECT_NEAR(adjusted.get_config().bounds->north, 2.0, 1e-12);
  EXPECT_NEAR(adjusted.get_config().bounds->south, 0.0, 1e-12);
}

static void TestRejectedCommandLines()
{
  CommandLineInterface unknown;
  EXPECT_FALSE(Parse(unknown, {"--frobnicate", "-s"}));
  EXPECT_EQ(unknown.exit_code(), 1);

  CommandLineInterface missing_input;
  EXPECT_FALSE(Parse(missing_input, {"--bounds", "0,0,1,1", "-s"}));
  EXPECT_EQ(missing_input.exit_code(), 1);

  CommandLineInterface junk_bounds;
  EXPECT_FALSE(Parse(junk_bounds, {"-i", "map.json", "--bounds", "a,b,c,d", "-s"}));
  EXPECT_EQ(junk_bounds.exit_code(), 1);

  CommandLineInterface inverted;
  EXPECT_FALSE(Parse(inverted, {"-i", "map.json", "--bounds", "1,0,0,1", "-s"}));
  EXPECT_EQ(inverted.exit_code(), 1);

  CommandLineInterface partial;
  EXPECT_FALSE(Parse(partial, {"-i", "map.json", "--north", "1", "-s"}));
  EXPECT_EQ(partial.exit_code(), 1);

  CommandLineInterface bad_format;
  EXPECT_FALSE(Parse(bad_format, {"-i", "map.json", "-f", "obj", "-s"}));
  EXPECT_EQ(bad_format.exit_code(), 1);

  CommandLineInterface bad_size;
  EXPECT_FALSE(Parse(bad_size, {"-i", "map.json", "--target-size", "big", "-s"}));
  EXPECT_EQ(bad_size.exit_code(), 1);

  CommandLineInterface no_value;
  EXPECT_FALSE(Parse(no_value, {"-i"}));
  EXPECT_EQ(no_value.exit_code(), 1);
}

static void TestVersionExitsCleanly()
{
  CommandLineInterface cli;
  EXPECT_FALSE(Parse(cli, {"--version"}));
  EXPECT_EQ(cli.exit_code(), 0);
}

static void TestDefaultConfigRoundTrip()
{
  const auto root = MakeTempPath("osmprint_cli");
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  const auto path = (root / "defaults.json").string();

  ASSERT_TRUE(CommandLineInterface::create_default_config_file(path));

  CommandLineInterface cli;
  ASSERT_TRUE(cli.load_config_file(path));
  const PrintConfig& config = cli.get_config();
  const PrintConfig defaults;
  EXPECT_EQ(config.input_file, std::string("map.json"));
  EXPECT_FALSE(config.bounds.has_value());
  EXPECT_NEAR(config.target_size_mm, defaults.target_size_mm, 1e-12);
  EXPECT_EQ(config.output_directory, defaults.output_directory);
  EXPECT_EQ(config.base_name, defaults.base_name);
  EXPECT_TRUE(config.output_formats == defaults.output_formats);
  EXPECT_EQ(config.vertex_colors, defaults.vertex_colors);
  EXPECT_EQ(config.stl_binary, defaults.stl_binary);
  EXPECT_FALSE(config.log_file.has_value());

  // Through the command line
  const auto created = (root / "created.json").string();
  CommandLineInterface creator;
  EXPECT_FALSE(Parse(creator, {"--create-config", created}));
  EXPECT_EQ(creator.exit_code(), 0);
  EXPECT_TRUE(std::filesystem::exists(created));

  std::filesystem::remove_all(root, ec);
}

static void TestCommandLineOverridesConfigFile()
{
  const auto root = MakeTempPath("osmprint_cli_config");
  std::error_code ec;
  std::filesystem::create_directories(root, ec);

  const auto path = root / "city.json";
  WriteText(path, R"({
    "input_file": "city_map.json",
    "bounds": [0.0, 0.0, 0.02, 0.02],
    "target_size_mm": 120,
    "output_formats": "STL",
    "base_name": "city"
  })");

  CommandLineInterface cli;
  ASSERT_TRUE(Parse(cli, {"--config", path.string(), "--target-size", "90", "-s"}));
  const PrintConfig& config = cli.get_config();
  EXPECT_EQ(config.input_file, std::string("city_map.json"));
  ASSERT_TRUE(config.bounds.has_value());
  EXPECT_NEAR(config.bounds->east, 0.02, 1e-12);
  EXPECT_NEAR(config.target_size_mm, 90.0, 1e-12);
  ASSERT_TRUE(config.output_formats.size() == 1);
  EXPECT_EQ(config.output_formats[0], std::string("stl"));
  EXPECT_EQ(config.base_name, std::string("city"));
  ASSERT_TRUE(config.config_file.has_value());
  EXPECT_EQ(*config.config_file, path.string());

  const auto broken = root / "broken.json";
  WriteText(broken, "{ \"input_file\": ");
  CommandLineInterface broken_cli;
  EXPECT_FALSE(Parse(broken_cli, {"--config", broken.string(), "-s"}));
  EXPECT_EQ(broken_cli.exit_code(), 1);

  const auto bad_bounds = root / "bad_bounds.json";
  WriteText(bad_bounds, R"({"input_file": "a.json", "bounds": "1,2"})");
  CommandLineInterface bad_bounds_cli;
  EXPECT_FALSE(bad_bounds_cli.load_config_file(bad_bounds.string()));

  CommandLineInterface missing_file;
  EXPECT_FALSE(missing_file.load_config_file((root / "nope.json").string()));

  std::filesystem::remove_all(root, ec);
}

int main()
{
  QuietLogging();

  TestParseBounds();
  TestParseFormats();
  TestFullCommandLine();
  TestPositionalInputAndEdges();
  TestRejectedCommandLines();
  TestVersionExitsCleanly();
  TestDefaultConfigRoundTrip();
  TestCommandLineOverridesConfigFile();

  return TestExit("osmprint_cli_tests");
}
