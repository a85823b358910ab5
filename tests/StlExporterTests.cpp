#include "LiteTest.hpp"

#include "export/STLExporter.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

using namespace osmprint;

namespace {

// 200 m region at 100 mm: a base slab and one tower
SolidModel TwoPieceModel()
{
  SolidModel model;
  model.layers = ModelBuilder::default_layers();
  model.window = BoundaryWindow(Point3D(-100.0, 0.0, -100.0), Point3D(100.0, 0.0, 100.0));

  ScalingCalculator scaling;
  model.plan = scaling.plan(200.0, 200.0, 100.0);
  const double dvs = model.plan.display_vertical_scale;

  model.materials.push_back({"base", Color::from_rgb(0xCCCCCC)});
  model.materials.push_back({"building", Color::from_rgb(0x888888)});

  SolidMesh base;
  base.add_box(Point3D(-100.0, 0.0, -100.0), Point3D(100.0, 0.6 * dvs, 100.0));
  model.meshes.push_back(std::move(base));

  SolidMesh tower;
  tower.add_box(Point3D(-10.0, 0.6 * dvs, -10.0), Point3D(10.0, 3.0 * dvs, 10.0));
  model.meshes.push_back(std::move(tower));

  model.pieces.push_back({0, 0, LayerKind::BASE, 0.0, 0.6, 0});
  model.pieces.push_back({1, 1, LayerKind::BUILDING, 0.6, 2.4, 11});
  return model;
}

std::string ReadAll(const std::filesystem::path& path)
{
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

static void TestCollectTriangles()
{
  const SolidModel model = TwoPieceModel();
  STLExporter exporter;
  const auto triangles = exporter.collect_triangles(model);

  EXPECT_EQ(triangles.size(), model.triangle_count() * 3);
  EXPECT_EQ(triangles.size(), static_cast<size_t>(2 * 12 * 3));

  // Tower sits on top of the slab in print millimeters
  double tower_top = 0.0;
  for (size_t i = 36; i < triangles.size(); ++i) {
    tower_top = std::max(tower_top, triangles[i].z());
    EXPECT_TRUE(triangles[i].z() >= 0.6 - 1e-9);
  }
  EXPECT_NEAR(tower_top, 3.0, 1e-9);
}

static void TestFacetNormal()
{
  const Point3D up = STLExporter::facet_normal(Point3D(0, 0, 0), Point3D(2, 0, 0), Point3D(0, 2, 0));
  EXPECT_NEAR(up.x(), 0.0, 1e-12);
  EXPECT_NEAR(up.y(), 0.0, 1e-12);
  EXPECT_NEAR(up.z(), 1.0, 1e-12);

  const Point3D down = STLExporter::facet_normal(Point3D(0, 0, 0), Point3D(0, 2, 0), Point3D(2, 0, 0));
  EXPECT_NEAR(down.z(), -1.0, 1e-12);

  // Degenerate triangles keep a zero normal
  const Point3D none = STLExporter::facet_normal(Point3D(1, 1, 1), Point3D(1, 1, 1), Point3D(2, 2, 2));
  EXPECT_NEAR(none.to_eigen().norm(), 0.0, 1e-12);
}

static void TestBinaryFile()
{
  const auto root = MakeTempPath("osmprint_stl");
  std::error_code ec;
  std::filesystem::create_directories(root, ec);

  const SolidModel model = TwoPieceModel();
  STLExporter exporter;
  const auto path = root / STLExporter::file_name("city");
  exporter.write_file(model, path.string());

  ASSERT_TRUE(std::filesystem::exists(path));
  const size_t triangles = model.triangle_count();
  EXPECT_EQ(static_cast<size_t>(std::filesystem::file_size(path)), 84 + 50 * triangles);

  const std::string bytes = ReadAll(path);
  ASSERT_TRUE(bytes.size() >= 84);
  std::uint32_t stored = 0;
  std::memcpy(&stored, bytes.data() + 80, sizeof(stored));
  EXPECT_EQ(static_cast<size_t>(stored), triangles);

  std::filesystem::remove_all(root, ec);
}

static void TestAsciiFile()
{
  const auto root = MakeTempPath("osmprint_stl_ascii");
  std::error_code ec;
  std::filesystem::create_directories(root, ec);

  STLExporter::Options options;
  options.binary_format = false;
  STLExporter exporter(options);
  const auto path = root / "city.stl";
  exporter.write_file(TwoPieceModel(), path.string());

  const std::string text = ReadAll(path);
  EXPECT_EQ(text.rfind("solid osm_model\n", 0), static_cast<size_t>(0));
  EXPECT_TRUE(text.find("endsolid osm_model") != std::string::npos);

  size_t facets = 0;
  for (size_t pos = text.find("facet normal"); pos != std::string::npos; pos = text.find("facet normal", pos + 1)) {
    ++facets;
  }
  EXPECT_EQ(facets, static_cast<size_t>(24));

  std::filesystem::remove_all(root, ec);
}

static void TestInvalidModel()
{
  const auto root = MakeTempPath("osmprint_stl_invalid");
  std::error_code ec;
  std::filesystem::create_directories(root, ec);

  SolidModel model = TwoPieceModel();
  model.pieces.clear();
  STLExporter exporter;
  const auto path = root / "empty.stl";
  EXPECT_THROW(exporter.write_file(model, path.string()), ExportError);
  EXPECT_FALSE(std::filesystem::exists(path));

  SolidModel dangling = TwoPieceModel();
  dangling.pieces[0].mesh = 7;
  EXPECT_THROW((void)exporter.collect_triangles(dangling), ExportError);

  std::filesystem::remove_all(root, ec);
}

int main()
{
  QuietLogging();

  TestCollectTriangles();
  TestFacetNormal();
  TestBinaryFile();
  TestAsciiFile();
  TestInvalidModel();

  return TestExit("osmprint_stl_exporter_tests");
}
