#include "params/params_base.hpp"

namespace seacolor {
namespace core {


void ParamsBase::Parse(const cv::FileNode& root_node,
                       const cv::FileNode& shared_node)
{
  source_ = std::string("<node ") + std::string(root_node.name()) + ">";
  LoadParams(YamlParser(root_node, shared_node));
}


void ParamsBase::Parse(const std::string& filepath,
                       const std::string& shared_filepath)
{
  source_ = filepath;
  LoadParams(YamlParser(filepath, shared_filepath));
}


void ParamsBase::Parse(const YamlParser& parser)
{
  source_ = parser.Filepath();
  LoadParams(parser);
}


}
}
