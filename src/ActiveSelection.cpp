#include "ActiveSelection.h"

namespace ActiveSelection {

bool normalize(ConfigDocument &doc)
{
    bool changed = false;

    if (doc.isClient()) {
        changed |= normalize(doc.client.environments);
        changed |= normalize(doc.client.keys);
        return changed;
    }

    changed |= normalize(doc.primary.groups);
    for (auto &g : doc.primary.groups) {
        changed |= normalize(g.profiles);
        changed |= normalize(g.identities);
    }
    return changed;
}

bool holds(const ConfigDocument &doc)
{
    if (doc.isClient())
        return holds(doc.client.environments) && holds(doc.client.keys);

    if (!holds(doc.primary.groups)) return false;
    for (const auto &g : doc.primary.groups) {
        if (!holds(g.profiles) || !holds(g.identities))
            return false;
    }
    return true;
}

} // namespace ActiveSelection
