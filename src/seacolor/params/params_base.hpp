#pragma once

#include <string>

#include <opencv2/core/core.hpp>

#include "params/yaml_parser.hpp"

namespace seacolor {
namespace core {


// Base for all params structs. Derived structs declare their fields with defaults, implement
// LoadParams(), and get their constructors from SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS.
class ParamsBase {
 public:
  ParamsBase() = default;
  virtual ~ParamsBase() = default;

  void Parse(const cv::FileNode& root_node,
             const cv::FileNode& shared_node = cv::FileNode());

  void Parse(const std::string& filepath,
             const std::string& shared_filepath = "");

  void Parse(const YamlParser& parser);

  // Where the params were last parsed from (a filepath, or a node name). Empty for defaults.
  const std::string& Source() const { return source_; }

 protected:
  virtual void LoadParams(const YamlParser& parser) = 0;

 private:
  std::string source_;
};


}
}
