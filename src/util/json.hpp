#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

extern "C" {
    struct yyjson_mut_val;
    struct yyjson_mut_doc;
};

class JSONException : public std::exception
{
  public:
    std::string msg;

    JSONException(std::string msg) : msg(msg)
    {}

    const char *what() const noexcept override
    {
        return msg.c_str();
    }
};

/**
 * A temporary non-owning reference to a value inside a json_t document.
 */
class json_t;
class json_reference_t
{
  public:
    // ------------------------------------------- Array support ---------------------------------------------
    bool is_array() const;
    json_reference_t operator [](const size_t& idx) const;
    void append(const json_reference_t& elem);
    size_t size() const;

    // ------------------------------------------- Object support --------------------------------------------
    bool is_object() const;
    bool is_null() const;
    bool has_member(const std::string_view& key) const;

    /**
     * Access the member @key. A null value is turned into an empty object and
     * missing members are created as null, so this can be used for writing.
     */
    json_reference_t operator [](const std::string_view& key) const;
    json_reference_t operator [](const char *key) const;

    // ------------------------------------- Basic data types support ----------------------------------------
    json_reference_t& operator =(const unsigned int& v);
    json_reference_t& operator =(const int64_t& v);
    json_reference_t& operator =(const bool& v);
    json_reference_t& operator =(const std::string_view& v);
    json_reference_t& operator =(const char *v);
    json_reference_t& operator =(std::nullptr_t);

    bool is_uint() const;
    unsigned int as_uint() const;
    bool is_int64() const;
    int64_t as_int64() const;
    bool is_bool() const;
    bool as_bool() const;
    bool is_string() const;
    std::string as_string() const;

  private:
    friend class json_t;
    json_reference_t()
    {}
    json_reference_t(yyjson_mut_doc *doc, yyjson_mut_val *val) : doc(doc), v(val)
    {}

    void expect_array() const;

    yyjson_mut_doc *doc = NULL;
    yyjson_mut_val *v   = NULL;

    // Non-copyable, non-moveable.
    json_reference_t(const json_reference_t& other)  = delete;
    json_reference_t(const json_reference_t&& other) = delete;
    json_reference_t& operator =(const json_reference_t& other) = delete;
};

/**
 * An owning JSON document. The root value is accessible through the
 * json_reference_t interface.
 */
class json_t final : public json_reference_t
{
  public:
    json_t();
    json_t(const json_t& other);
    json_t(json_t&& other);
    ~json_t();

    json_t& operator =(const json_t& other);
    json_t& operator =(json_t&& other);

    static json_t array();

    /**
     * Parse the given source as a JSON document.
     *
     * @result Where to store the parsed document on success.
     * @return On failure, an error message describing the problem with the JSON source.
     * Otherwise std::nullopt.
     */
    static std::optional<std::string> parse_string(const std::string_view& source, json_t& result);

    /**
     * Get a JSON string representation of the document, indented when
     * @pretty is set.
     */
    std::string serialize(bool pretty = false) const;

  private:
    explicit json_t(yyjson_mut_doc *doc);
    void init();
};
