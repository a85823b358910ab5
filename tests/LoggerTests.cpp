#include "LiteTest.hpp"

#include <fstream>
#include <sstream>

using namespace osmprint;

static std::string ReadFile(const std::filesystem::path& path)
{
  std::ifstream in(path);
  std::ostringstream text;
  text << in.rdbuf();
  return text.str();
}

static size_t CountLines(const std::string& text, const std::string& needle)
{
  size_t count = 0;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.find(needle) != std::string::npos) {
      ++count;
    }
  }
  return count;
}

static void TestParseLogConfig()
{
  Logger::clearFacilityLevels();
  Logger::parseLogConfig("4, ModelBuilder=6,BoundaryClipper = 2,default=5");
  EXPECT_TRUE(Logger::getFacilityLevel("ModelBuilder") == LogLevel::TRACE);
  EXPECT_TRUE(Logger::getFacilityLevel("BoundaryClipper") == LogLevel::WARNING);
  EXPECT_TRUE(Logger::getFacilityLevel("Projector") == LogLevel::DEBUG);

  // Out-of-range levels clamp; junk is ignored
  Logger::parseLogConfig("ModelBuilder=42,Exporter=loud,0");
  EXPECT_TRUE(Logger::getFacilityLevel("ModelBuilder") == LogLevel::TRACE);
  EXPECT_TRUE(Logger::getFacilityLevel("Exporter") == LogLevel::ERROR);
  EXPECT_TRUE(Logger::getFacilityLevel("Projector") == LogLevel::ERROR);

  Logger::clearFacilityLevels();
  QuietLogging();
}

static void TestEffectiveLevel()
{
  Logger::clearFacilityLevels();
  Logger::setDefaultLevel(LogLevel::INFO);

  Logger logger("ScalingCalculator");
  EXPECT_TRUE(logger.getEffectiveLevel() == LogLevel::INFO);
  EXPECT_TRUE(logger.shouldOutput(LogLevel::INFO));
  EXPECT_FALSE(logger.shouldOutput(LogLevel::DEBUG));

  logger.setLogLevel(LogLevel::DEBUG);
  EXPECT_TRUE(logger.shouldOutput(LogLevel::DEBUG));

  // Facility overrides win over the instance level
  Logger::setFacilityLevel("ScalingCalculator", LogLevel::ERROR);
  EXPECT_FALSE(logger.shouldOutput(LogLevel::WARNING));

  Logger::clearFacilityLevels();
  logger.setLogLevel(LogLevel::WARNING);
  EXPECT_TRUE(logger.getEffectiveLevel() == LogLevel::INFO);

  QuietLogging();
}

static void TestLogFileAndRepeats()
{
  const auto root = MakeTempPath("osmprint_logger");
  const auto path = root / "logs" / "run.log";

  ASSERT_TRUE(Logger::setGlobalLogFile(path.string()));
  Logger::setFacilityLevel("LoggerTest", LogLevel::DETAILED);
  {
    Logger logger("LoggerTest");
    logger.info("stage one");
    logger.info("stage one");
    logger.info("stage one");
    logger.detailed("stage two");
    logger.debug("hidden");
    logger.flush();
  }
  EXPECT_TRUE(Logger::setGlobalLogFile(std::nullopt));
  Logger::clearFacilityLevels();

  const std::string text = ReadFile(path);
  EXPECT_EQ(CountLines(text, "LoggerTest: stage one"), static_cast<size_t>(1));
  EXPECT_EQ(CountLines(text, "occurred 3 times"), static_cast<size_t>(1));
  EXPECT_EQ(CountLines(text, "DETL  LoggerTest: stage two"), static_cast<size_t>(1));
  EXPECT_EQ(CountLines(text, "hidden"), static_cast<size_t>(0));

  EXPECT_FALSE(Logger::setGlobalLogFile((root / "missing.log" / "").string()));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}

int main()
{
  QuietLogging();

  TestParseLogConfig();
  TestEffectiveLevel();
  TestLogFileAndRepeats();

  return TestExit("osmprint_logger_tests");
}
