#include "SQLiteLogKit/ExceptionCodec.hxx"
#include "SQLiteLogKit/Errors.hxx"

#include <cxxabi.h>

#include <cctype>
#include <cstdlib>
#include <typeinfo>
#include <vector>

namespace SQLiteLogKit {

    namespace {
        constexpr const char* kType = "Type";
        constexpr const char* kMessage = "Message";
        constexpr const char* kStackTrace = "StackTrace";
        constexpr const char* kSource = "Source";
        constexpr const char* kData = "Data";
        constexpr const char* kInner = "InnerException";

        void fill_node(SerializedException& node, const std::exception& ex) {
            node.type = ExceptionCodec::type_name(ex);
            node.message = ex.what();
            if (const auto* annotated = dynamic_cast<const AnnotatedError*>(&ex)) {
                node.data = annotated->data();
                node.source = annotated->source();
                node.stack_trace = annotated->stack_trace();
            }
        }

        // Rethrows the cause nested in ex (if any) and captures it into slot.
        void capture_cause(const std::exception& ex, std::unique_ptr<SerializedException>& slot) {
            try {
                std::rethrow_if_nested(ex);
            } catch (const std::exception& cause) {
                slot = std::make_unique<SerializedException>();
                fill_node(*slot, cause);
                capture_cause(cause, slot->inner);
            } catch (...) {
                slot = std::make_unique<SerializedException>();
                slot->type = "unknown";
                slot->message = "non-standard exception";
            }
        }

        std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
            const auto it = j.find(key);
            if (it == j.end() || !it->is_string()) return std::nullopt;
            return it->get<std::string>();
        }

        bool blank(std::string_view text) {
            for (const char c : text) {
                if (!std::isspace(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }
    }

    SerializedException::SerializedException(const SerializedException& other)
        : type(other.type),
          message(other.message),
          stack_trace(other.stack_trace),
          source(other.source),
          data(other.data),
          inner(other.inner ? std::make_unique<SerializedException>(*other.inner) : nullptr) {}

    SerializedException& SerializedException::operator=(const SerializedException& other) {
        if (this != &other) {
            SerializedException copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    // Unlinks iteratively so very long cause chains do not recurse in the destructor.
    SerializedException::~SerializedException() {
        auto next = std::move(inner);
        while (next) next = std::move(next->inner);
    }

    size_t SerializedException::depth() const {
        size_t n = 1;
        for (const auto* p = inner.get(); p; p = p->inner.get()) ++n;
        return n;
    }

    std::string ExceptionCodec::type_name(const std::exception& ex) {
        const char* mangled = typeid(ex).name();
        int status = 0;
        char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
        std::string name = (status == 0 && demangled) ? demangled : mangled;
        std::free(demangled);
        return name;
    }

    SerializedException ExceptionCodec::flatten(const std::exception& ex) {
        SerializedException root;
        fill_node(root, ex);
        capture_cause(ex, root.inner);
        return root;
    }

    std::optional<SerializedException> ExceptionCodec::flatten(const std::exception_ptr& ex) {
        if (!ex) return std::nullopt;
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            return flatten(e);
        } catch (...) {
            SerializedException unknown;
            unknown.type = "unknown";
            unknown.message = "non-standard exception";
            return unknown;
        }
    }

    nlohmann::json ExceptionCodec::to_json(const SerializedException& ex) {
        // Built innermost-first so arbitrarily deep chains need no recursion.
        std::vector<const SerializedException*> chain;
        for (const auto* p = &ex; p; p = p->inner.get()) chain.push_back(p);

        nlohmann::json result;
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            const auto& node = **it;
            nlohmann::json j;
            j[kType] = node.type;
            j[kMessage] = node.message;
            if (node.stack_trace) j[kStackTrace] = *node.stack_trace;
            if (node.source) j[kSource] = *node.source;
            j[kData] = node.data.is_object() ? node.data : nlohmann::json::object();
            if (!result.is_null()) j[kInner] = std::move(result);
            result = std::move(j);
        }
        return result;
    }

    std::optional<SerializedException> ExceptionCodec::from_json(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        const auto root_type = optional_string(j, kType);
        if (!root_type) return std::nullopt;

        SerializedException root;
        SerializedException* node = &root;
        const nlohmann::json* current = &j;
        for (size_t depth = 1;; ++depth) {
            node->type = optional_string(*current, kType).value_or("");
            node->message = optional_string(*current, kMessage).value_or("");
            node->stack_trace = optional_string(*current, kStackTrace);
            node->source = optional_string(*current, kSource);
            const auto data = current->find(kData);
            node->data = (data != current->end() && data->is_object()) ? *data : nlohmann::json::object();

            const auto inner = current->find(kInner);
            if (depth >= kMaxDepth || inner == current->end() || !inner->is_object() ||
                !optional_string(*inner, kType)) {
                break;
            }
            node->inner = std::make_unique<SerializedException>();
            node = node->inner.get();
            current = &*inner;
        }
        return root;
    }

    std::string ExceptionCodec::encode(const SerializedException& ex) {
        // Messages come from arbitrary code; invalid UTF-8 is replaced rather than rejected.
        return to_json(ex).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::optional<SerializedException> ExceptionCodec::decode(std::string_view text) {
        if (text.empty() || blank(text)) return std::nullopt;
        const auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded()) return std::nullopt;
        return from_json(parsed);
    }

} // namespace SQLiteLogKit
