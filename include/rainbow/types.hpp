// Rainbow type algebra: interned structural types and the satisfaction relation.
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace rainbow
{

    // Host misconfiguration: malformed signature text, registration after freeze, ...
    struct config_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    using TypeId = uint32_t; // 0 is never a valid type

    enum class PrimitiveKind
    {
        Number,
        String,
        Boolean,
        Time
    };

    struct RecordField
    {
        std::string name;
        TypeId type{0};
        bool optional{false};
    };

    struct ParamType
    {
        std::string name;
        TypeId type{0};
        bool variadic{false};
        bool optional{false};
    };

    struct Type
    {
        enum class Kind
        {
            Primitive,
            List,
            Record,
            Block,
            Function
        } kind;
        PrimitiveKind prim{};             // Primitive
        TypeId elem{0};                   // List
        std::vector<RecordField> fields;  // Record (sorted by name)
        std::vector<TypeId> inputs;       // Block
        TypeId output{0};                 // Block, Function
        std::string name;                 // Function (dispatch keyword)
        std::vector<ParamType> params;    // Function (params[0] is the dispatch keyword)
        bool partial{false};              // Function
        std::vector<std::string> effects; // Function (sorted, unique)

        const RecordField *field(std::string_view n) const
        {
            for (auto &f : fields)
                if (f.name == n)
                    return &f;
            return nullptr;
        }
        const ParamType *param(std::string_view n) const
        {
            for (auto &p : params)
                if (p.name == n)
                    return &p;
            return nullptr;
        }
    };

    // Owns and interns types. A context may be layered over a frozen parent (the
    // signature table's context); ids of the parent stay valid in the child and
    // structurally equal types always share one id across both layers.
    class TypeContext
    {
    public:
        TypeContext();
        explicit TypeContext(const TypeContext *parent);

        TypeId get_primitive(PrimitiveKind k);
        TypeId get_number() { return get_primitive(PrimitiveKind::Number); }
        TypeId get_string() { return get_primitive(PrimitiveKind::String); }
        TypeId get_boolean() { return get_primitive(PrimitiveKind::Boolean); }
        TypeId get_time() { return get_primitive(PrimitiveKind::Time); }
        TypeId get_list(TypeId elem);
        // Throws std::invalid_argument on duplicate field names.
        TypeId get_record(std::vector<RecordField> fields);
        TypeId get_block(std::vector<TypeId> inputs, TypeId output);
        // Function types are not interned; each call yields a fresh id.
        TypeId add_function(std::string name, std::vector<ParamType> params, TypeId output, bool partial, std::vector<std::string> effects);

        const Type &at(TypeId id) const;
        bool valid(TypeId id) const { return id != 0 && id < end_; }
        TypeId end() const { return end_; }
        const TypeContext *parent() const { return parent_; }

        std::string to_string(TypeId id) const;

        // Parse a type written in signature notation ("[ number... ]", "{ string => boolean }").
        // Throws config_error on malformed text.
        TypeId parse_type(std::string_view text);

    private:
        using RecordKey = std::vector<std::tuple<std::string, TypeId, bool>>;
        using BlockKey = std::pair<std::vector<TypeId>, TypeId>;

        const TypeContext *parent_{nullptr};
        TypeId base_{1};
        TypeId end_{1};
        std::vector<Type> types_; // types_[i] has id base_ + i
        std::map<int, TypeId> prim_cache_;
        std::map<TypeId, TypeId> list_cache_;
        std::map<RecordKey, TypeId> record_cache_;
        std::map<BlockKey, TypeId> block_cache_;

        TypeId add_type(Type t);
        std::optional<TypeId> find_primitive(int key) const;
        std::optional<TypeId> find_list(TypeId elem) const;
        std::optional<TypeId> find_record(const RecordKey &key) const;
        std::optional<TypeId> find_block(const BlockKey &key) const;
    };

    // "A value declared as `right` may be used where `left` is expected."
    bool satisfies(const TypeContext &ctx, TypeId left, TypeId right);

    // Same relation, explaining the first structural failure; nullopt when satisfied.
    std::optional<std::string> why_unsatisfied(const TypeContext &ctx, TypeId left, TypeId right);

    inline bool mutually_satisfy(const TypeContext &ctx, TypeId a, TypeId b) { return satisfies(ctx, a, b) && satisfies(ctx, b, a); }

    const char *primitive_name(PrimitiveKind k);

} // namespace rainbow
