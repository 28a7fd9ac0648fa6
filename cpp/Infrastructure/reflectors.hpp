#pragma once
/**
 * @file Infrastructure/reflectors.hpp
 *
 * @brief Defines templates and macros for reflecting simple structs
 *
 * Reflection is the declaration of the fields of a type so that generic code can operate on specific types. Our
 * reflection is done at compile-time so that the compiler can be made to automatically generate code to operate on
 * specific types. Reflection here covers only public data members, not methods, and does not support inheritance.
 *
 * A reflected struct gets a specialization of `reflector` which knows the struct's name, the number of its members,
 * and can visit each member of an instance in declaration order, passing the visitor the member's name and a
 * reference to it. The member name is the same text used as the key when the struct is converted to and from JSON,
 * so structs mirroring server records should name their members after the server's fields.
 */

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/size.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <cstddef>
#include <type_traits>

namespace infra {

/**
 * @brief A template to store compile-time reflection information about structs or classes
 *
 * @tparam Container The type being reflected
 */
template<class Container>
struct reflector {
    /// The type being reflected
    using type = Container;
    /// Whether the reflector is defined or not
    using is_defined = std::false_type;
    /// The number of reflected members
    constexpr static std::size_t member_count = 0;
    /// The name of the Container type
    constexpr static const char* type_name = "Unreflected type";

    /// @brief Call visitor(name, member) for each reflected member of record; unreflected types have none
    template<class Record, class Visitor>
    static void for_each_member(Record&, Visitor&&) {}
};

} // namespace infra

// Macros to aid in creating reflectors
/// For use with BOOST_PP_SEQ_FOR_EACH, to visit one member of the record
#define IMPL_REFLECT_VISIT_MEMBER(R, Struct, Member) \
    visitor(BOOST_PP_STRINGIZE(Member), record.Member);

/// @macro Reflect a struct and its members, as in REFLECT_STRUCT(MyStruct, (memberA)(memberB))
/// @note Must be used within the global namespace
#define REFLECT_STRUCT(Struct, Members) \
    namespace infra { \
    template<> struct reflector<Struct> { \
        using type = Struct; using is_defined = std::true_type; \
        constexpr static std::size_t member_count = BOOST_PP_SEQ_SIZE(Members); \
        constexpr static const char* type_name = BOOST_PP_STRINGIZE(Struct); \
        template<class Record, class Visitor> \
        static void for_each_member(Record& record, Visitor&& visitor) { \
            static_assert(std::is_same_v<std::remove_const_t<Record>, Struct>, \
                          "Reflector visited with a record of the wrong type"); \
            BOOST_PP_SEQ_FOR_EACH(IMPL_REFLECT_VISIT_MEMBER, Struct, Members) \
        } \
    }; }
