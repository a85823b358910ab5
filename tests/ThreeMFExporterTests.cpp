#include "LiteTest.hpp"

#include "export/ThreeMFExporter.hpp"

#include <algorithm>
#include <limits>

using namespace osmprint;

namespace {

// 500 m square region printed at 100 mm: 5 m per mm
SolidModel MakeModel(double display_vertical_scale)
{
  SolidModel model;
  model.layers = ModelBuilder::default_layers();
  model.window = BoundaryWindow(Point3D(-250.0, 0.0, -250.0), Point3D(250.0, 0.0, 250.0));

  ScalingCalculator scaling;
  model.plan = scaling.plan(500.0, 500.0, 100.0);
  model.plan.display_vertical_scale = display_vertical_scale;
  const double dvs = display_vertical_scale;

  model.materials.push_back({"base", Color::from_rgb(0xCCCCCC)});
  model.materials.push_back({"building", Color::from_rgb(0x888888)});

  SolidMesh base;
  base.add_box(Point3D(-250.0, 0.0, -250.0), Point3D(250.0, 0.6 * dvs, 250.0));
  model.meshes.push_back(std::move(base));

  SolidMesh building;
  const std::vector<Point3D> ring = {Point3D(0, 0, 0), Point3D(50, 0, 0), Point3D(50, 0, 50), Point3D(0, 0, 50)};
  building.add_extruded_polygon(ring, 0.6 * dvs, 4.6 * dvs);
  model.meshes.push_back(std::move(building));

  model.pieces.push_back({0, 0, LayerKind::BASE, 0.0, 0.6, 0});
  model.pieces.push_back({1, 1, LayerKind::BUILDING, 0.6, 4.0, 7});
  return model;
}

double SignedVolume(const std::vector<Point3D>& p)
{
  double volume = 0.0;
  for (size_t i = 0; i + 2 < p.size(); i += 3) {
    volume += p[i].to_eigen().dot(p[i + 1].to_eigen().cross(p[i + 2].to_eigen()));
  }
  return volume / 6.0;
}

struct Range {
  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();
  void add(double v) { lo = std::min(lo, v); hi = std::max(hi, v); }
};

size_t CountOccurrences(const std::string& text, const std::string& needle)
{
  size_t count = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
    ++count;
  }
  return count;
}

} // namespace

static void TestVerticalExtentIndependentOfPreviewScale()
{
  for (double dvs : {10.0, 37.0}) {
    const SolidModel model = MakeModel(dvs);
    ThreeMFExporter exporter;
    const ExportDocument document = exporter.build_document(model);
    ASSERT_TRUE(document.geometries.size() == 2);

    Range x, y, z;
    for (const auto& p : document.geometries[1].positions) {
      x.add(p.x());
      y.add(p.y());
      z.add(p.z());
    }
    EXPECT_NEAR(z.lo, 0.6, 1e-9);
    EXPECT_NEAR(z.hi, 4.6, 1e-9);
    EXPECT_NEAR(z.hi - z.lo, 4.0, 1e-9);

    // 50 m footprint at 5 m/mm, mirrored onto the negative axes
    EXPECT_NEAR(x.hi - x.lo, 10.0, 1e-9);
    EXPECT_NEAR(x.lo, -10.0, 1e-9);
    EXPECT_NEAR(y.lo, -10.0, 1e-9);
  }
}

static void TestWindingStaysOutward()
{
  const SolidModel model = MakeModel(10.0);
  ThreeMFExporter exporter;
  const ExportDocument document = exporter.build_document(model);

  EXPECT_NEAR(SignedVolume(document.geometries[0].positions), 100.0 * 100.0 * 0.6, 1e-6);
  EXPECT_NEAR(SignedVolume(document.geometries[1].positions), 10.0 * 10.0 * 4.0, 1e-6);

  PrintTransform transform = PrintTransform::for_model(model);
  EXPECT_TRUE(transform.reverses_winding());
  EXPECT_NEAR(transform.horizontal_scale(), 5.0, 1e-12);
}

static void TestInterning()
{
  SolidModel model = MakeModel(10.0);
  // Same mesh, same band: shares the object
  model.pieces.push_back({1, 1, LayerKind::BUILDING, 0.6, 4.0, 8});
  // Same mesh, different band: its own object
  model.pieces.push_back({1, 1, LayerKind::BUILDING, 0.6, 2.0, 9});

  ThreeMFExporter exporter;
  const ExportDocument document = exporter.build_document(model);

  EXPECT_EQ(document.materials.size(), static_cast<size_t>(2));
  EXPECT_EQ(document.geometries.size(), static_cast<size_t>(3));
  ASSERT_TRUE(document.components.size() == 4);

  EXPECT_EQ(document.base_materials_id, 1);
  EXPECT_EQ(document.color_group_id, 0);
  EXPECT_EQ(document.components[0], 2);
  EXPECT_EQ(document.components[1], 3);
  EXPECT_EQ(document.components[2], 3);
  EXPECT_EQ(document.components[3], 4);
  EXPECT_EQ(document.assembly_id, 5);
  EXPECT_EQ(document.geometries[2].material_index, static_cast<size_t>(1));

  const std::string xml = exporter.to_xml(document);
  EXPECT_EQ(CountOccurrences(xml, "<component objectid=\"3\"/>"), static_cast<size_t>(2));
  EXPECT_EQ(CountOccurrences(xml, "<object id="), static_cast<size_t>(4));
}

static void TestXmlStructure()
{
  const SolidModel model = MakeModel(10.0);
  ThreeMFExporter::Options options;
  options.title = "A & B";
  ThreeMFExporter exporter(options);

  const ExportDocument document = exporter.build_document(model);
  const std::string xml = exporter.to_xml(document);

  EXPECT_TRUE(xml.find("unit=\"millimeter\"") != std::string::npos);
  EXPECT_TRUE(xml.find(kThreeMFCoreNamespace) != std::string::npos);
  EXPECT_TRUE(xml.find("<metadata name=\"Title\">A &amp; B</metadata>") != std::string::npos);
  EXPECT_TRUE(xml.find("<basematerials id=\"1\">") != std::string::npos);
  EXPECT_TRUE(xml.find("<base name=\"building\" displaycolor=\"#888888\"/>") != std::string::npos);
  EXPECT_TRUE(xml.find("<object id=\"3\" type=\"model\" pid=\"1\" pindex=\"1\">") != std::string::npos);
  EXPECT_TRUE(xml.find("<item objectid=\"4\" transform=\"1 0 0 0 1 0 0 0 1 0 0 0\"/>") != std::string::npos);
  EXPECT_TRUE(xml.find("m:colorgroup") == std::string::npos);

  EXPECT_EQ(CountOccurrences(xml, "<triangle "), document.triangle_count());
  EXPECT_EQ(CountOccurrences(xml, "<vertex "), document.triangle_count() * 3);
  EXPECT_EQ(document.triangle_count(), model.triangle_count());
}

static void TestVertexColors()
{
  const SolidModel model = MakeModel(10.0);
  ThreeMFExporter::Options options;
  options.vertex_colors = true;
  ThreeMFExporter exporter(options);

  const ExportDocument document = exporter.build_document(model);
  EXPECT_EQ(document.color_group_id, 2);
  EXPECT_EQ(document.geometries[0].object_id, 3);
  EXPECT_EQ(document.assembly_id, 5);

  const std::string xml = exporter.to_xml(document);
  EXPECT_TRUE(xml.find("xmlns:m=\"") != std::string::npos);
  EXPECT_TRUE(xml.find("<m:colorgroup id=\"2\">") != std::string::npos);
  EXPECT_TRUE(xml.find("<m:color color=\"#CCCCCC\"/>") != std::string::npos);
  EXPECT_TRUE(xml.find("pid=\"2\" p1=\"1\" p2=\"1\" p3=\"1\"") != std::string::npos);
}

static void TestFlatPieceSitsOnTopOfBand()
{
  SolidModel model = MakeModel(10.0);
  SolidMesh water;
  water.add_plane(-250.0, -250.0, 250.0, 250.0, 7.0);
  model.meshes.push_back(std::move(water));
  model.materials.push_back({"water", Color::from_rgb(0x2196F3)});
  model.pieces.push_back({2, 2, LayerKind::WATER, 0.6, 0.1, 0});

  ThreeMFExporter exporter;
  const ExportDocument document = exporter.build_document(model);
  ASSERT_TRUE(document.geometries.size() == 3);
  for (const auto& p : document.geometries[2].positions) {
    EXPECT_NEAR(p.z(), 0.7, 1e-12);
  }
}

static void TestFormatTransform()
{
  Eigen::Affine3d placement = Eigen::Affine3d::Identity();
  EXPECT_EQ(ThreeMFExporter::format_transform(placement), std::string("1 0 0 0 1 0 0 0 1 0 0 0"));

  placement.linear() = Eigen::Vector3d(2.0, 3.0, 4.0).asDiagonal();
  EXPECT_EQ(ThreeMFExporter::format_transform(placement), std::string("2 0 0 0 3 0 0 0 4 0 0 0"));

  // Column of the x axis comes first
  placement = Eigen::Affine3d::Identity();
  placement.linear()(0, 1) = 0.5;
  placement.translation() = Eigen::Vector3d(10.0, -5.0, 2.5);
  EXPECT_EQ(ThreeMFExporter::format_transform(placement), std::string("1 0 0 0.5 1 0 0 0 1 10 -5 2.5"));

  ThreeMFExporter::Options options;
  options.placement = Eigen::Affine3d(Eigen::Translation3d(100.0, 100.0, 0.0));
  ThreeMFExporter exporter(options);
  const std::string xml = exporter.export_model(MakeModel(10.0));
  EXPECT_TRUE(xml.find("transform=\"1 0 0 0 1 0 0 0 1 100 100 0\"") != std::string::npos);
}

static void TestInvalidModelsThrow()
{
  ThreeMFExporter exporter;

  SolidModel no_pieces = MakeModel(10.0);
  no_pieces.pieces.clear();
  EXPECT_THROW((void)exporter.build_document(no_pieces), ExportError);

  SolidModel no_window = MakeModel(10.0);
  no_window.window.reset();
  EXPECT_THROW((void)exporter.build_document(no_window), ExportError);

  SolidModel dangling_mesh = MakeModel(10.0);
  dangling_mesh.pieces[1].mesh = 99;
  EXPECT_THROW((void)exporter.build_document(dangling_mesh), ExportError);

  SolidModel dangling_material = MakeModel(10.0);
  dangling_material.pieces[0].material = 42;
  EXPECT_THROW((void)exporter.build_document(dangling_material), ExportError);

  SolidModel empty_mesh = MakeModel(10.0);
  empty_mesh.meshes.push_back(SolidMesh());
  empty_mesh.pieces.push_back({2, 0, LayerKind::ROAD, 1.1, 0.2, 5});
  EXPECT_THROW((void)exporter.build_document(empty_mesh), ExportError);

  EXPECT_THROW((void)PrintTransform(Point3D(), 0.0), ExportError);
  EXPECT_THROW((void)PrintTransform(Point3D(), -1.0), ExportError);
}

static void TestWriteFile()
{
  const auto root = MakeTempPath("osmprint_3mf");
  std::error_code ec;
  std::filesystem::create_directories(root, ec);

  ThreeMFExporter exporter;
  const auto path = (root / ThreeMFExporter::file_name("city")).string();
  exporter.write_file(MakeModel(10.0), path);
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_TRUE(std::filesystem::file_size(path) > 0);

  // A failed export leaves no file behind
  SolidModel broken = MakeModel(10.0);
  broken.pieces.clear();
  const auto broken_path = (root / "broken.3mf").string();
  EXPECT_THROW(exporter.write_file(broken, broken_path), ExportError);
  EXPECT_FALSE(std::filesystem::exists(broken_path));

  EXPECT_THROW(exporter.write_file(MakeModel(10.0), (root / "missing" / "dir" / "x.3mf").string()), ExportError);

  std::filesystem::remove_all(root, ec);
}

int main()
{
  QuietLogging();

  TestVerticalExtentIndependentOfPreviewScale();
  TestWindingStaysOutward();
  TestInterning();
  TestXmlStructure();
  TestVertexColors();
  TestFlatPieceSitsOnTopOfBand();
  TestFormatTransform();
  TestInvalidModelsThrow();
  TestWriteFile();

  return TestExit("osmprint_3mf_exporter_tests");
}
