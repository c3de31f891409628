#include "xml_text_writer.hpp"

#include "internal/util/errors.hpp"

namespace chadoxml::xml {

namespace {

const xmlChar* X(const std::string& s) {
  return BAD_CAST s.c_str();
}

} // namespace

XmlTextWriter::XmlTextWriter(std::ostream& out, bool indent) : out_(out) {
  xmlOutputBufferPtr buffer = xmlOutputBufferCreateIO(&XmlTextWriter::WriteCallback, nullptr, &out_, nullptr);
  if (buffer == nullptr) {
    throw util::SerializationError("xmlOutputBufferCreateIO failed");
  }

  // the writer owns buffer from here on
  writer_ = xmlNewTextWriter(buffer);
  if (writer_ == nullptr) {
    xmlOutputBufferClose(buffer);
    throw util::SerializationError("xmlNewTextWriter failed");
  }

  if (indent) {
    Check(xmlTextWriterSetIndent(writer_, 1), "set indent");
    Check(xmlTextWriterSetIndentString(writer_, BAD_CAST "  "), "set indent string");
  }
}

XmlTextWriter::~XmlTextWriter() {
  if (writer_ != nullptr) {
    xmlFreeTextWriter(writer_);
  }
}

int XmlTextWriter::WriteCallback(void* context, const char* buffer, int len) {
  auto* out = static_cast<std::ostream*>(context);
  out->write(buffer, len);
  return out->good() ? len : -1;
}

void XmlTextWriter::Check(int rc, const char* what) const {
  if (rc < 0) {
    throw util::SerializationError(std::string("XML writer: ") + what + " failed");
  }
}

void XmlTextWriter::StartDocument() {
  Check(xmlTextWriterStartDocument(writer_, "1.0", "UTF-8", nullptr), "start document");
}

void XmlTextWriter::StartElement(const std::string& name) {
  Check(xmlTextWriterStartElement(writer_, X(name)), "start element");
}

void XmlTextWriter::Attribute(const std::string& name, const std::string& value) {
  Check(xmlTextWriterWriteAttribute(writer_, X(name), X(value)), "write attribute");
}

void XmlTextWriter::Element(const std::string& name, const std::string& text) {
  Check(xmlTextWriterWriteElement(writer_, X(name), X(text)), "write element");
}

void XmlTextWriter::EndElement() {
  Check(xmlTextWriterEndElement(writer_), "end element");
}

void XmlTextWriter::EndDocument() {
  Check(xmlTextWriterEndDocument(writer_), "end document");
  Check(xmlTextWriterFlush(writer_), "flush");
  out_.flush();
  if (!out_.good()) {
    throw util::SerializationError("XML writer: output stream failed");
  }
}

} // namespace chadoxml::xml
