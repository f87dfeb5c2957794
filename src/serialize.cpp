#include "serialize.hpp"
#include "definition.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "hash.hpp"
#include "scope_guard.hpp"

#include <bkassert/assert.hpp>

#include <rapidjson/reader.h>
#include <rapidjson/filereadstream.h>
#include <rapidjson/error/en.h>

#include <string>
#include <vector>
#include <cmath>
#include <cstdio>
#include <cstdint>

namespace skirmish {

uint32_t to_property(std::nullptr_t) noexcept {
    return 0u;
}

uint32_t to_property(bool const n) noexcept {
    return n ? 1u : 0u;
}

uint32_t to_property(int32_t const n) noexcept {
    return static_cast<uint32_t>(n);
}

uint32_t to_property(uint32_t const n) noexcept {
    return n;
}

uint32_t to_property(double const n) noexcept {
    // 16.16 fixed point
    return static_cast<uint32_t>(
        static_cast<int32_t>(std::lround(n * (1 << 16u))));
}

uint32_t to_property(string_view const n) noexcept {
    return djb2_hash_32(n.begin(), n.end());
}

double from_fixed_point(uint32_t const n) noexcept {
    return static_cast<int32_t>(n) / static_cast<double>(1 << 16u);
}

namespace {

enum class element_type {
    none
  , null, boolean, i32, u32, i64, u64, float_p, string
  , obj_start, obj_key, obj_end
  , arr_start, arr_end
};

char const* to_string(element_type const type) noexcept {
    switch (type) {
    case element_type::none:      return "nothing";
    case element_type::null:      return "null";
    case element_type::boolean:   return "a boolean";
    case element_type::i32:       return "an integer";
    case element_type::u32:       return "an integer";
    case element_type::i64:       return "a 64 bit integer";
    case element_type::u64:       return "a 64 bit integer";
    case element_type::float_p:   return "a number";
    case element_type::string:    return "a string";
    case element_type::obj_start: return "an object";
    case element_type::obj_key:   return "a key";
    case element_type::obj_end:   return "the end of an object";
    case element_type::arr_start: return "an array";
    case element_type::arr_end:   return "the end of an array";
    }

    return "{unknown}";
}

template <typename Definition> struct definition_traits;

template <> struct definition_traits<equipment_definition> {
    using on_finish_t = on_finish_equipment_definition;
    static constexpr uint32_t type_hash = djb2_hash_32c("equipment");
};

template <> struct definition_traits<entity_definition> {
    using on_finish_t = on_finish_entity_definition;
    static constexpr uint32_t type_hash = djb2_hash_32c("entities");
};

enum class definition_handler_state {
    start
  ,   type, type_value
  ,   data, data_start
  ,     def_id_or_end
  ,     def_id, def_start
  ,       def_name, def_name_value
  ,       def_properties, def_properties_start
  ,         property_name_or_end
  ,         property_name, property_value
  ,       def_properties_end
  ,     def_end
  ,   data_end
  , end
};

} // namespace

//=====--------------------------------------------------------------------=====
// Receives the rapidjson SAX events, recording the last element seen, and
// forwards to the state machine in Derived.
//=====--------------------------------------------------------------------=====
template <typename Derived, typename StateType>
class definition_handler_base {
public:
    using state_type = StateType;

    definition_handler_base() = default;

    bool run() {
        return static_cast<Derived*>(this)->run();
    }

    void set_current_state(state_type const state) noexcept {
        return static_cast<Derived*>(this)->set_current_state(state);
    }

    element_type current_type() const noexcept {
        return last_type_;
    }

    std::string const& error() const noexcept {
        return error_;
    }

    bool transition(
        element_type const expected_type
      , state_type   const next_state
    ) {
        if (last_type_ != expected_type) {
            return unexpected();
        }

        set_current_state(next_state);
        return true;
    }

    //! Transition only if the last element has the hash of @p expected.
    template <size_t N>
    bool transition(
        element_type const expected_type
      , char const (&expected)[N]
      , state_type   const next_state
    ) {
        if (last_type_ != expected_type
         || last_string_hash_ != djb2_hash_32c(expected)
        ) {
            static_string_buffer<128> buffer;
            buffer.append("expected \"%s\" but found \"%s\""
              , expected, last_string_.c_str());
            error_ = buffer.to_string();
            return false;
        }

        set_current_state(next_state);
        return true;
    }

    template <typename Action>
    bool transition(
        element_type const expected_type
      , state_type   const next_state
      , Action             a
    ) {
        if (!transition(expected_type, next_state)) {
            return false;
        }

        a();
        return true;
    }

    bool unexpected() {
        error_ = std::string {"unexpected "} + to_string(last_type_);
        return false;
    }

    //! The last element as a property value; false for elements that can't
    //! be one.
    bool to_property(serialize_data_type& type, uint32_t& value) const noexcept {
        using st = serialize_data_type;

        switch (last_type_) {
        case element_type::null:
            type  = st::null;
            value = skirmish::to_property(nullptr);
            return true;
        case element_type::boolean:
            type  = st::boolean;
            value = skirmish::to_property(last_bool_);
            return true;
        case element_type::i32:
            type  = st::i32;
            value = skirmish::to_property(last_i32_);
            return true;
        case element_type::u32:
            type  = st::u32;
            value = skirmish::to_property(last_u32_);
            return true;
        case element_type::float_p:
            type  = st::float_p;
            value = skirmish::to_property(last_double_);
            return true;
        case element_type::string:
            type  = st::string;
            value = last_string_hash_;
            return true;
        case element_type::i64:       SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::u64:       SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::none:      SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::obj_start: SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::obj_key:   SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::obj_end:   SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::arr_start: SK_ATTRIBUTE_FALLTHROUGH;
        case element_type::arr_end:   SK_ATTRIBUTE_FALLTHROUGH;
        default:
            break;
        }

        return false;
    }
public:
    bool Null() {
        last_type_ = element_type::null;
        return run();
    }

    bool Bool(bool const b) {
        last_type_ = element_type::boolean;
        last_bool_ = b;
        return run();
    }

    bool RawNumber(const char*, size_t, bool) noexcept {
        return true;
    }

    bool Int(int const i) {
        last_type_ = element_type::i32;
        last_i32_ = i;
        return run();
    }

    bool Uint(unsigned const i) {
        last_type_ = element_type::u32;
        last_u32_ = i;
        return run();
    }

    bool Int64(int64_t) {
        last_type_ = element_type::i64;
        return run();
    }

    bool Uint64(uint64_t) {
        last_type_ = element_type::u64;
        return run();
    }

    bool Double(double const d) {
        last_type_ = element_type::float_p;
        last_double_ = d;
        return run();
    }

    bool String(const char* const s, size_t const len, bool) {
        last_type_ = element_type::string;
        last_string_.assign(s, len);
        last_string_hash_ = djb2_hash_32(s, s + len);
        return run();
    }

    bool StartObject() {
        last_type_ = element_type::obj_start;
        return run();
    }

    bool EndObject(size_t) {
        last_type_ = element_type::obj_end;
        return run();
    }

    bool Key(const char* const s, size_t const len, bool) {
        last_type_ = element_type::obj_key;
        last_string_.assign(s, len);
        last_string_hash_ = djb2_hash_32(s, s + len);
        return run();
    }

    bool StartArray() {
        last_type_ = element_type::arr_start;
        return run();
    }

    bool EndArray(size_t) {
        last_type_ = element_type::arr_end;
        return run();
    }
protected:
    std::string  error_            {};
    element_type last_type_        {element_type::none};
    uint32_t     last_string_hash_ {};
    std::string  last_string_      {};
    double       last_double_      {};
    unsigned     last_u32_         {};
    int          last_i32_         {};
    bool         last_bool_        {};
};

//=====--------------------------------------------------------------------=====
// The state machine for one kind of definition file.
//=====--------------------------------------------------------------------=====
template <typename Definition>
class definition_handler
    : public definition_handler_base<definition_handler<Definition>
                                   , definition_handler_state>
{
    using base_t      = definition_handler_base<definition_handler<Definition>
                                              , definition_handler_state>;
    using traits_t    = definition_traits<Definition>;
    using on_finish_t = typename traits_t::on_finish_t;
    using id_t        = typename Definition::definition_id_t;
    using property_t  = typename Definition::property_t;
public:
    using state_type = definition_handler_state;

    definition_handler(
        on_finish_t         const& on_finish
      , on_add_new_property const& on_property
    ) : on_finish_   {on_finish}
      , on_property_ {on_property}
    {
    }

    void set_current_state(state_type const state) noexcept {
        state_ = state;
    }

    bool run();
private:
    bool add_property() {
        serialize_data_type type {};
        uint32_t value {};

        if (!this->to_property(type, value)) {
            this->error_ = "property \"" + last_property_name_
                         + "\" has an unsupported value";
            return false;
        }

        if (!on_property_(last_property_name_, last_property_name_hash_
                        , type, value)
        ) {
            this->error_ = "property \"" + last_property_name_
                         + "\" was rejected";
            return false;
        }

        def_.properties.add_or_update_property(
            property_t {last_property_name_hash_}, value);

        return true;
    }
private:
    on_finish_t         const& on_finish_;
    on_add_new_property const& on_property_;

    Definition def_;

    std::string last_property_name_      {};
    uint32_t    last_property_name_hash_ {};

    state_type state_ {state_type::start};
};

template <typename Definition>
bool definition_handler<Definition>::run() {
    using st = state_type;
    using et = element_type;

    auto const last_type = this->last_type_;

    for (;;) switch (state_) {
    case st::start:
        return this->transition(et::obj_start, st::type);
    case st::type:
        return this->transition(et::obj_key, "type", st::type_value);
    case st::type_value:
        if (last_type != et::string
         || this->last_string_hash_ != traits_t::type_hash
        ) {
            this->error_ = "unexpected definition type \"" + this->last_string_ + "\"";
            return false;
        }

        state_ = st::data;
        return true;
    case st::data:
        return this->transition(et::obj_key, "data", st::data_start);
    case st::data_start:
        return this->transition(et::obj_start, st::def_id_or_end);
    case st::def_id_or_end:
        if (last_type == et::obj_key) {
            state_ = st::def_id;
            continue;
        } else if (last_type == et::obj_end) {
            state_ = st::data_end;
            continue;
        }

        return this->unexpected();
    case st::def_id:
        return this->transition(et::obj_key, st::def_start, [&] {
            def_.id_string = this->last_string_;
            def_.id = id_t {this->last_string_hash_};
        });
    case st::def_start:
        return this->transition(et::obj_start, st::def_name);
    case st::def_name:
        return this->transition(et::obj_key, "name", st::def_name_value);
    case st::def_name_value:
        return this->transition(et::string, st::def_properties, [&] {
            def_.name = this->last_string_;
        });
    case st::def_properties:
        return this->transition(et::obj_key, "properties", st::def_properties_start);
    case st::def_properties_start:
        return this->transition(et::obj_start, st::property_name_or_end);
    case st::property_name_or_end:
        if (last_type == et::obj_key) {
            state_ = st::property_name;
            continue;
        } else if (last_type == et::obj_end) {
            state_ = st::def_properties_end;
            continue;
        }

        return this->unexpected();
    case st::property_name:
        return this->transition(et::obj_key, st::property_value, [&] {
            last_property_name_      = this->last_string_;
            last_property_name_hash_ = this->last_string_hash_;
        });
    case st::property_value:
        if (!add_property()) {
            return false;
        }

        state_ = st::property_name_or_end;
        return true;
    case st::def_properties_end:
        return this->transition(et::obj_end, st::def_end);
    case st::def_end:
        return this->transition(et::obj_end, st::def_id_or_end, [&] {
            on_finish_(def_);
            def_.clear();
        });
    case st::data_end:
        return this->transition(et::obj_end, st::end);
    case st::end:
        return this->transition(et::obj_end, st::start);
    default:
        BK_ASSERT(false);
        break;
    }

    return false;
}

namespace {

template <typename Handler, typename Stream>
void impl_parse_(
    string_view   const source
  , Stream&             in
  , Handler&            handler
) {
    rapidjson::Reader reader {nullptr};

    auto const result = reader.Parse(in, handler);
    if (result) {
        return;
    }

    auto const reason = result.Code() == rapidjson::kParseErrorTermination
      ? handler.error().c_str()
      : rapidjson::GetParseError_En(result.Code());

    static_string_buffer<512> buffer;
    buffer.append("%.*s: %s (at offset %zu)"
      , static_cast<int>(source.size()), source.data()
      , reason, result.Offset());

    throw data_error {buffer.to_string()};
}

template <typename Definition, typename Finish>
void impl_load_definitions_(
    string_view         const  filename
  , Finish              const& on_finish
  , on_add_new_property const& on_property
) {
    constexpr size_t buffer_size = 65536;

    definition_handler<Definition> handler {on_finish, on_property};

    std::string const name {filename.data(), filename.size()};

    auto const handle = std::fopen(name.c_str(), "rb");
    if (!handle) {
        throw data_error {"couldn't open \"" + name + "\""};
    }

    auto const on_exit = SK_SCOPE_EXIT {
        std::fclose(handle);
    };

    std::vector<char> buffer(buffer_size);
    rapidjson::FileReadStream in {handle, buffer.data(), buffer.size()};

    impl_parse_(filename, in, handler);
}

template <typename Definition, typename Finish>
void impl_parse_definitions_(
    string_view         const  json
  , Finish              const& on_finish
  , on_add_new_property const& on_property
) {
    definition_handler<Definition> handler {on_finish, on_property};

    std::string const text {json.data(), json.size()};
    rapidjson::StringStream in {text.c_str()};

    impl_parse_("{string}", in, handler);
}

} // namespace

void load_equipment_definitions(
    string_view                    const  filename
  , on_finish_equipment_definition const& on_finish
  , on_add_new_property            const& on_property
) {
    impl_load_definitions_<equipment_definition>(filename, on_finish, on_property);
}

void load_entity_definitions(
    string_view                 const  filename
  , on_finish_entity_definition const& on_finish
  , on_add_new_property         const& on_property
) {
    impl_load_definitions_<entity_definition>(filename, on_finish, on_property);
}

void parse_equipment_definitions(
    string_view                    const  json
  , on_finish_equipment_definition const& on_finish
  , on_add_new_property            const& on_property
) {
    impl_parse_definitions_<equipment_definition>(json, on_finish, on_property);
}

void parse_entity_definitions(
    string_view                 const  json
  , on_finish_entity_definition const& on_finish
  , on_add_new_property         const& on_property
) {
    impl_parse_definitions_<entity_definition>(json, on_finish, on_property);
}

} //namespace skirmish
