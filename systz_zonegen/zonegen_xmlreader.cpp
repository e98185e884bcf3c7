#include <libxml/xmlreader.h>

#include "zonegen_xmlreader.h"

XmlReader::~XmlReader()
{
    if (_reader != nullptr)
    {
        xmlFreeTextReader(_reader);
    }
}

void XmlReader::OnError(void* arg, const char* msg, int severity, void* locator)
{
    auto reader = static_cast<XmlReader*>(arg);
    if (severity == XML_PARSER_SEVERITY_ERROR || severity == XML_PARSER_SEVERITY_VALIDITY_ERROR)
    {
        reader->_failed = true;
        if (reader->_error.empty() && msg != nullptr)
        {
            reader->_error = msg;
            while (!reader->_error.empty() && (reader->_error.back() == '\n' || reader->_error.back() == ' '))
            {
                reader->_error.pop_back();
            }
        }
    }
}

bool XmlReader::Load(const std::string& input)
{
    // Never touch the network for DTDs or external entities.
    const int options = XML_PARSE_NONET | XML_PARSE_NOWARNING;

    _reader = xmlReaderForMemory(input.data(), static_cast<int>(input.size()), nullptr, nullptr, options);
    if (_reader == nullptr)
    {
        _failed = true;
        _error = "unable to create the XML reader";
        return false;
    }

    xmlTextReaderSetErrorHandler(_reader,
        [](void* arg, const char* msg, xmlParserSeverities severity, xmlTextReaderLocatorPtr locator)
        {
            XmlReader::OnError(arg, msg, severity, locator);
        },
        this);
    return true;
}

bool XmlReader::Read()
{
    if (_reader == nullptr)
    {
        return false;
    }

    int ret = xmlTextReaderRead(_reader);
    if (ret < 0)
    {
        _failed = true;
        if (_error.empty())
        {
            _error = "malformed XML";
        }
    }
    return ret == 1 && !_failed;
}

int XmlReader::Depth() const
{
    return xmlTextReaderDepth(_reader);
}

std::string XmlReader::NodeName() const
{
    const xmlChar* name = xmlTextReaderConstLocalName(_reader);
    if (name == nullptr)
    {
        return std::string();
    }
    // xmlChar*s are UTF-8, so this cast is safe.
    return std::string(reinterpret_cast<const char*>(name));
}

bool XmlReader::IsStartElement() const
{
    return xmlTextReaderNodeType(_reader) == XML_READER_TYPE_ELEMENT;
}

std::optional<std::string> XmlReader::NodeAttribute(const char* name) const
{
    xmlChar* value = xmlTextReaderGetAttribute(_reader, reinterpret_cast<const xmlChar*>(name));
    if (value == nullptr)
    {
        return std::nullopt;
    }

    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

int XmlReader::GetLineNumber() const
{
    return xmlTextReaderGetParserLineNumber(_reader);
}
