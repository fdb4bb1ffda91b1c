#include "json.hpp"
#include <cstdlib>
#include <limits>
#include <utility>
#include <yyjson.h>

void json_reference_t::expect_array() const
{
    if (!is_array())
    {
        throw JSONException("Not an array");
    }
}

bool json_reference_t::is_array() const
{
    return yyjson_mut_is_arr(v);
}

json_reference_t json_reference_t::operator [](const size_t& idx) const
{
    expect_array();
    if (idx >= size())
    {
        throw JSONException("Index out of bounds");
    }

    return json_reference_t{doc, yyjson_mut_arr_get(v, idx)};
}

void json_reference_t::append(const json_reference_t& elem)
{
    expect_array();
    yyjson_mut_arr_append(v, yyjson_mut_val_mut_copy(doc, elem.v));
}

size_t json_reference_t::size() const
{
    expect_array();
    return yyjson_mut_arr_size(v);
}

bool json_reference_t::is_object() const
{
    return yyjson_mut_is_obj(v);
}

bool json_reference_t::is_null() const
{
    return yyjson_mut_is_null(v);
}

bool json_reference_t::has_member(const std::string_view& key) const
{
    return is_object() && (yyjson_mut_obj_getn(v, key.data(), key.size()) != NULL);
}

json_reference_t json_reference_t::operator [](const char *key) const
{
    return this->operator [](std::string_view{key});
}

json_reference_t json_reference_t::operator [](const std::string_view& key) const
{
    if (!(is_object() || is_null()))
    {
        throw JSONException("Trying to access into JSON value that is not an object!");
    }

    if (is_null())
    {
        yyjson_mut_set_obj(v);
    }

    auto ptr = yyjson_mut_obj_getn(v, key.data(), key.size());
    if (ptr != NULL)
    {
        return json_reference_t{doc, ptr};
    }

    auto key_yy = yyjson_mut_strncpy(doc, key.data(), key.size());
    auto value  = yyjson_mut_null(doc);
    yyjson_mut_obj_add(v, key_yy, value);
    return json_reference_t{doc, value};
}

// --------------------------------------- Basic data types support ------------------------------------------
json_reference_t& json_reference_t::operator =(const unsigned int& v)
{
    yyjson_mut_set_uint(this->v, v);
    return *this;
}

json_reference_t& json_reference_t::operator =(const int64_t& v)
{
    yyjson_mut_set_sint(this->v, v);
    return *this;
}

json_reference_t& json_reference_t::operator =(const bool& v)
{
    yyjson_mut_set_bool(this->v, v);
    return *this;
}

json_reference_t& json_reference_t::operator =(const std::string_view& v)
{
    // the string has to be owned by our document
    auto our_v = yyjson_mut_strncpy(doc, v.data(), v.size());
    yyjson_mut_set_strn(this->v, yyjson_mut_get_str(our_v), v.size());
    return *this;
}

json_reference_t& json_reference_t::operator =(const char *v)
{
    return this->operator =(std::string_view{v});
}

json_reference_t& json_reference_t::operator =(std::nullptr_t)
{
    yyjson_mut_set_null(this->v);
    return *this;
}

bool json_reference_t::is_uint() const
{
    return yyjson_mut_is_uint(v) &&
           (yyjson_mut_get_uint(v) <= std::numeric_limits<unsigned int>::max());
}

unsigned int json_reference_t::as_uint() const
{
    if (!is_uint())
    {
        throw JSONException("Not an uint");
    }

    return yyjson_mut_get_uint(v);
}

bool json_reference_t::is_int64() const
{
    if (yyjson_mut_is_uint(v))
    {
        return yyjson_mut_get_uint(v) <= (uint64_t)std::numeric_limits<int64_t>::max();
    }

    return yyjson_mut_is_sint(v);
}

int64_t json_reference_t::as_int64() const
{
    if (!is_int64())
    {
        throw JSONException("Not an int64");
    }

    if (yyjson_mut_is_uint(v))
    {
        return yyjson_mut_get_uint(v);
    }

    return yyjson_mut_get_sint(v);
}

bool json_reference_t::is_bool() const
{
    return yyjson_mut_is_bool(v);
}

bool json_reference_t::as_bool() const
{
    if (!is_bool())
    {
        throw JSONException("Not a bool");
    }

    return yyjson_mut_get_bool(v);
}

bool json_reference_t::is_string() const
{
    return yyjson_mut_is_str(v);
}

std::string json_reference_t::as_string() const
{
    if (!is_string())
    {
        throw JSONException("Not a string");
    }

    return std::string(yyjson_mut_get_str(v), yyjson_mut_get_len(v));
}

// ------------------------------------------------ json_t ---------------------------------------------------
void json_t::init()
{
    this->doc = yyjson_mut_doc_new(NULL);
    this->v   = yyjson_mut_null(this->doc);
    yyjson_mut_doc_set_root(doc, v);
}

json_t::json_t()
{
    init();
}

json_t::json_t(yyjson_mut_doc *doc)
{
    this->doc = doc;
    this->v   = yyjson_mut_doc_get_root(this->doc);
}

json_t::json_t(const json_t& other) : json_reference_t()
{
    this->doc = yyjson_mut_doc_mut_copy(other.doc, NULL);
    this->v   = yyjson_mut_doc_get_root(this->doc);
}

json_t::json_t(json_t&& other) : json_reference_t()
{
    *this = std::move(other);
}

json_t::~json_t()
{
    yyjson_mut_doc_free(doc);
}

json_t& json_t::operator =(const json_t& other)
{
    if (this != &other)
    {
        yyjson_mut_doc_free(doc);
        this->doc = yyjson_mut_doc_mut_copy(other.doc, NULL);
        this->v   = yyjson_mut_doc_get_root(this->doc);
    }

    return *this;
}

json_t& json_t::operator =(json_t&& other)
{
    if (this != &other)
    {
        yyjson_mut_doc_free(doc);
        this->doc = other.doc;
        this->v   = other.v;

        other.doc = NULL;
        other.v   = NULL;
    }

    return *this;
}

json_t json_t::array()
{
    json_t r;
    yyjson_mut_set_arr(r.v);
    return r;
}

std::optional<std::string> json_t::parse_string(const std::string_view& source, json_t& result)
{
    yyjson_read_err error;
    auto doc = yyjson_read_opts((char*)source.data(), source.length(), 0, NULL, &error);
    if (!doc)
    {
        return std::string("Failed to parse JSON, error ") +
               std::to_string(error.code) + ": " + error.msg + " (at offset " +
               std::to_string(error.pos) + ")";
    }

    result = json_t{yyjson_doc_mut_copy(doc, NULL)};
    yyjson_doc_free(doc);
    return std::nullopt;
}

std::string json_t::serialize(bool pretty) const
{
    size_t len;
    char *source = yyjson_mut_write(this->doc, pretty ? YYJSON_WRITE_PRETTY : 0, &len);
    if (!source)
    {
        throw JSONException("Failed to serialize JSON document");
    }

    std::string result{source, len};
    free(source);
    return result;
}
