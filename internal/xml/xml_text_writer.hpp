#pragma once

#include <libxml/xmlwriter.h>

#include <ostream>
#include <string>

namespace chadoxml::xml {

/*
  Streaming XML writer over libxml2's xmlTextWriter, sinking into a
  std::ostream. Every libxml2 failure, including a failed stream write,
  raises util::SerializationError.
*/
class XmlTextWriter {
 public:
  XmlTextWriter(std::ostream& out, bool indent);
  ~XmlTextWriter();

  XmlTextWriter(const XmlTextWriter&)            = delete;
  XmlTextWriter& operator=(const XmlTextWriter&) = delete;

  void StartDocument();
  void StartElement(const std::string& name);
  void Attribute(const std::string& name, const std::string& value);
  void Element(const std::string& name, const std::string& text);
  void EndElement();

  // Closes open elements and flushes into the stream.
  void EndDocument();

 private:
  static int WriteCallback(void* context, const char* buffer, int len);

  void Check(int rc, const char* what) const;

  std::ostream&    out_;
  xmlTextWriterPtr writer_ = nullptr;
};

} // namespace chadoxml::xml
