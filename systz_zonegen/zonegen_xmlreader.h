#ifndef __ZONEGEN_XMLREADER_H__
#define __ZONEGEN_XMLREADER_H__

#include <optional>
#include <string>

extern "C" {
struct _xmlTextReader;
}

// A thin wrapper around libxml's xmlTextReader, which walks the document
// node by node without building a tree.
class XmlReader
{
private:
    _xmlTextReader* _reader = nullptr;
    bool _failed = false;
    std::string _error;

    static void OnError(void* arg, const char* msg, int severity, void* locator);
public:
    XmlReader() = default;
    XmlReader(const XmlReader&) = delete;
    XmlReader& operator=(const XmlReader&) = delete;
    ~XmlReader();

    // |input| must outlive the reader. Returns false on error.
    bool Load(const std::string& input);

    // Advances to the next node. Returns false on EOF or error; HasError()
    // tells the two apart.
    bool Read();

    bool HasError() const { return _failed; }
    const std::string& GetError() const { return _error; }

    // Zero for the root element.
    int Depth() const;

    // The local name of the current node, without namespace prefix.
    std::string NodeName() const;

    // True for opening tags, including self-closing ones.
    bool IsStartElement() const;

    std::optional<std::string> NodeAttribute(const char* name) const;

    int GetLineNumber() const;
};

#endif // __ZONEGEN_XMLREADER_H__
