#pragma once

#include "types.hpp"
#include "property_set.hpp"

#include <string>
#include <utility>

namespace skirmish {

template <typename Id, typename PropertyKey, typename PropertyValue>
struct basic_definition {
    using definition_id_t  = Id;
    using property_t       = PropertyKey;
    using property_value_t = PropertyValue;
    using properties_t     = property_set<PropertyKey, PropertyValue>;

    basic_definition() = default;

    basic_definition(std::string def_id_string, definition_id_t const def_id)
      : id        {def_id}
      , id_string {std::move(def_id_string)}
    {
    }

    void clear() {
        properties.clear();
        id = definition_id_t {};
        name.clear();
        id_string.clear();
    }

    properties_t    properties {};
    definition_id_t id         {};
    std::string     name       {"{null}"};
    std::string     id_string  {"{null}"};
};

//! A kind of equipment as read from a data file; "category" picks which of
//! the other properties apply.
struct equipment_definition : basic_definition<equipment_id
                                             , equipment_property_id
                                             , equipment_property_value>
{
    using basic_definition::basic_definition;
};

//! A kind of hero or monster as read from a data file, including the ids of
//! the equipment it starts with.
struct entity_definition : basic_definition<entity_id
                                          , entity_property_id
                                          , entity_property_value>
{
    using basic_definition::basic_definition;
};

} //namespace skirmish
