#pragma once

#include <string>
#include <vector>

#include <glog/logging.h>

#include <opencv2/core/core.hpp>
#include <opencv2/core/persistence.hpp>

#include "core/eigen_types.hpp"

namespace seacolor {
namespace core {


// Returns whether an id is requesting a "shared" parameter (prefixed by /shared/).
// If so, returns the suffix of the id after /shared/.
static inline bool CheckIfSharedId(const std::string& id, std::string& suffix)
{
  const bool is_shared = id.substr(0, 8) == "/shared/";

  if (is_shared) {
    suffix = id.substr(8, std::string::npos);
  } else {
    suffix = "";
  }

  return is_shared;
}


// Class for parsing a YAML file, using OpenCV's FileStorage module.
class YamlParser {
 public:
  YamlParser() = default;

  // Construct with a path to a .yaml file. Optionally provide a shared_filepath, which points to
  // a shared_params.yaml file.
  explicit YamlParser(const std::string& filepath,
                      const std::string& shared_filepath = "");

  // Close OpenCV Filestorage IO on destruct.
  ~YamlParser();

  // Construct from a YAML node.
  YamlParser(const cv::FileNode& root_node,
             const cv::FileNode& shared_node,
             const std::string& filepath = "",
             const std::string& shared_filepath = "");

  // Retrieve a param from the YAML hierarchy and pass it to output parameter.
  template <class ParamType>
  void GetParam(const std::string& id, ParamType* output) const
  {
    CHECK_NOTNULL(output);
    const cv::FileNode& node = GetNode(id);
    node >> *output;
  }

  // Retrieve a YAML param and return it.
  template <class ParamType>
  ParamType GetParam(const std::string& id) const
  {
    ParamType output;
    GetParam<ParamType>(id, &output);
    return output;
  }

  // Whether a node exists at id (relative to the root or the shared node).
  bool HasNode(const std::string& id) const;

  // Get a YAML node relative to the root. This is used for constructing params that are a subtree.
  cv::FileNode GetNode(const std::string& id) const;

  YamlParser Subtree(const std::string& id) const;

  const std::string& Filepath() const { return filepath_; }

 private:
  // Recursively finds a node with "id", starting from the "root_node".
  cv::FileNode GetNodeHelper(const cv::FileNode& root_node, const std::string& id) const;

  // Returns a string with information about the YAML filepaths, node names, etc. to debug parsing errors.
  std::string HelpfulError(const std::string& id) const;

 private:
  cv::FileStorage fs_, fs_shared_;
  cv::FileNode root_node_;
  cv::FileNode shared_node_;
  std::string filepath_, shared_filepath_;
};


// Convert a YAML list to an Eigen vector type.
template <typename VectorType>
void YamlToVector(const cv::FileNode& node, VectorType& vout)
{
  CHECK(node.isSeq()) << "Trying to parse a Vector from a YAML non-sequence" << std::endl;
  CHECK((int)node.size() == vout.rows())
      << "YamlToVector: expected " << vout.rows() << " values but found " << node.size() << std::endl;
  for (int i = 0; i < vout.rows(); ++i) {
    vout(i) = (float)node[i];
  }
}


// Parse a tensor stored as {shape: [d0, d1, ...], data: [...]}. The shape must exactly match
// expected_shape, and the flattened (row-major) data is copied into vout.
template <typename VectorType>
void YamlToTensor(const cv::FileNode& node, const std::vector<int>& expected_shape, VectorType& vout)
{
  CHECK(node.isMap()) << "YamlToTensor: tensor '" << node.name() << "' must be a map with shape and data" << std::endl;

  const cv::FileNode& shape_node = node["shape"];
  const cv::FileNode& data_node = node["data"];
  CHECK(shape_node.type() != cv::FileNode::NONE && data_node.type() != cv::FileNode::NONE)
      << "YamlToTensor: required 'shape' or 'data' attribute not found in '" << node.name() << "'" << std::endl;
  CHECK(shape_node.isSeq()) << "YamlToTensor: 'shape' must be a sequence" << std::endl;

  std::vector<int> shape;
  int numel = 1;
  for (size_t i = 0; i < shape_node.size(); ++i) {
    shape.emplace_back((int)shape_node[(int)i]);
    numel *= shape.back();
  }

  CHECK(shape == expected_shape) << "YamlToTensor: tensor '" << node.name() << "' has the wrong shape" << std::endl;
  CHECK_EQ(numel, (int)vout.rows()) << "YamlToTensor: output vector doesn't match tensor size" << std::endl;

  YamlToVector<VectorType>(data_node, vout);
}


// Write a vector as a tensor node {shape: [...], data: [...]} that YamlToTensor can read back.
template <typename VectorType>
void TensorToYaml(cv::FileStorage& fs,
                  const std::string& name,
                  const std::vector<int>& shape,
                  const VectorType& v)
{
  CHECK(fs.isOpened()) << "TensorToYaml: FileStorage is not open for writing" << std::endl;
  fs << name << "{";
  fs << "shape" << "[:";
  for (int d : shape) { fs << d; }
  fs << "]";
  fs << "data" << "[:";
  for (int i = 0; i < v.rows(); ++i) { fs << (float)v(i); }
  fs << "]";
  fs << "}";
}


// Parse and return a string.
std::string YamlToString(const cv::FileNode& node);


// Parse and return an enum (cast from an int to enum type).
template <typename EnumT>
inline EnumT YamlToEnum(const cv::FileNode& node)
{
  CHECK(node.type() != cv::FileNode::NONE);
  int val;
  node >> val;
  return static_cast<EnumT>(val);
}


}
}
