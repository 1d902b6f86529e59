#ifndef LANTERN_FWD_HPP
#define LANTERN_FWD_HPP

#include "lantern/settings.hpp"

LANTERN_IF_DEBUG() // silence unused warning for settings.hpp

namespace lantern {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define LANTERN_ENUM_STRING_CASE8(...)                                                             \
    case __VA_ARGS__: return u8## #__VA_ARGS__

enum struct Access_Specifier : Default_Underlying;
template <typename>
struct Annotation_Span;
struct Autolinker;
struct Build_Context;
struct Build_Error;
struct Builder;
struct Config;
struct Config_Error;
struct Diagnostic;
struct Doc_Comment;
struct Doc_HTML_Context;
struct Doc_Example;
struct Doc_Param;
struct Entry;
struct Error_Tag;
struct File_Node;
struct File_Root;
struct Glob;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Linker;
struct Linker_Options;
struct Logger;
struct Nav_Anchor;
struct Nav_Dir;
struct Nav_Item;
struct Nav_Link;
struct Nav_Root;
struct Page_Info;
struct Parameter;
struct Render_Error;
struct Renderer;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Source_Location;
struct Success_Tag;
struct Symbol;
struct Symbol_Graph;
enum struct Symbol_Kind : Default_Underlying;
struct Synchronized_Logger;
struct Syntax_Highlighter;
enum struct Syntax_Highlight_Error : Default_Underlying;
struct Template_Renderer;
struct Template_Variable;
struct Tutorial;
struct Tutorial_Folder;
struct Tutorial_Node;
struct Url_Path;

namespace ast {

struct Entity;
enum struct Entity_Kind : Default_Underlying;
struct Location;

} // namespace ast

namespace json {

struct Array;
struct Member;
struct Null;
struct Object;
struct Value;

} // namespace json

} // namespace lantern

#endif
