#include <gtest/gtest.h>
#include <glog/logging.h>

#include "core/macros.hpp"
#include "params/params_base.hpp"

using namespace seacolor;
using namespace core;


struct StageParams final : public ParamsBase
{
  SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(StageParams);

  double scale = 1.0;
  bool enabled = false;
  int kernel = 3;

 private:
  void LoadParams(const YamlParser& parser) override
  {
    parser.GetParam("scale", &scale);
    parser.GetParam("enabled", &enabled);
    parser.GetParam("Inner/kernel", &kernel);
  }
};


struct NestedParams final : public ParamsBase
{
  SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(NestedParams);

  std::string label;
  int num_frames = 0;
  Vector3d gains = Vector3d::Zero();

  StageParams stage;

 private:
  void LoadParams(const YamlParser& parser) override
  {
    label = YamlToString(parser.GetNode("label"));
    parser.GetParam("num_frames", &num_frames);
    YamlToVector<Vector3d>(parser.GetNode("gains"), gains);
    stage = StageParams(parser.Subtree("Stage"));
  }
};


static void ExpectLoaded(const NestedParams& params)
{
  EXPECT_EQ("dive01", params.label);
  EXPECT_EQ(12, params.num_frames);
  EXPECT_EQ(Vector3d(1.0, 0.5, 0.25), params.gains);
  EXPECT_DOUBLE_EQ(0.001, params.stage.scale);
  EXPECT_TRUE(params.stage.enabled);
  EXPECT_EQ(5, params.stage.kernel);
}


TEST(ParamsBaseTest, TestDefaults)
{
  const NestedParams params;
  EXPECT_EQ(0, params.num_frames);
  EXPECT_FALSE(params.stage.enabled);
  EXPECT_EQ(3, params.stage.kernel);
}


TEST(ParamsBaseTest, TestParseOverloads)
{
  const std::string filepath = "./resources/nested_params.yaml";

  // Default construct with parse afterwards.
  NestedParams params1;
  params1.Parse(filepath);
  ExpectLoaded(params1);

  const NestedParams params2(filepath);
  ExpectLoaded(params2);

  const YamlParser parser(filepath);
  const NestedParams params3(parser);
  ExpectLoaded(params3);

  // A struct can also be built straight from a node.
  const StageParams stage(parser.GetNode("Stage"));
  EXPECT_EQ(5, stage.kernel);
}


TEST(ParamsBaseTest, TestSource)
{
  EXPECT_EQ("", NestedParams().Source());

  const NestedParams params("./resources/nested_params.yaml");
  EXPECT_EQ("./resources/nested_params.yaml", params.Source());

  // Subtrees remember the file they came from.
  EXPECT_EQ("./resources/nested_params.yaml", params.stage.Source());
}
