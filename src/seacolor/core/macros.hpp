#pragma once


#define SEACOLOR_DELETE_DEFAULT_CONSTRUCTOR(TypeName) \
  TypeName() = delete;


#define SEACOLOR_DELETE_COPY_CONSTRUCTORS(TypeName) \
  TypeName(const TypeName&) = delete;                \
  TypeName& operator=(const TypeName&) = delete;


// Every params struct can be default constructed (keeping its in-class defaults), or parsed from
// a YAML file, a YAML node, or an existing parser. LoadParams() must be implemented.
#define SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(ClassName) \
  ClassName() : ParamsBase() {} \
  explicit ClassName(const cv::FileNode& root_node, const cv::FileNode& shared_node = cv::FileNode()) : ParamsBase() { Parse(root_node, shared_node); } \
  explicit ClassName(const std::string& filepath, const std::string& shared_filepath = "") : ParamsBase() { Parse(filepath, shared_filepath); } \
  explicit ClassName(const YamlParser& parser) : ParamsBase() { Parse(parser); }
