#include "field_registry.h"

namespace hf {

#define X_DEF(ident, abbrev, name, type) const FieldInfo ident{abbrev, name, FieldType::type};
TAK_FIELDS(X_DEF)
OMNI_FIELDS(X_DEF)
#undef X_DEF

const std::vector<const FieldInfo*>& all_fields() {
    static const std::vector<const FieldInfo*> fields = {
        #define X_PTR(ident, abbrev, name, type) &ident,
        TAK_FIELDS(X_PTR)
        OMNI_FIELDS(X_PTR)
        #undef X_PTR
    };
    return fields;
}

} // namespace hf

namespace ei {

#define X_DEF(ident, abbrev, summary, group, severity) \
    const ExpertDef ident{abbrev, summary, ExpertDef::Group::group, ExpertDef::Severity::severity};
DISSECTOR_EXPERTS(X_DEF)
#undef X_DEF

const std::vector<const ExpertDef*>& all_experts() {
    static const std::vector<const ExpertDef*> experts = {
        #define X_PTR(ident, abbrev, summary, group, severity) &ident,
        DISSECTOR_EXPERTS(X_PTR)
        #undef X_PTR
    };
    return experts;
}

} // namespace ei
