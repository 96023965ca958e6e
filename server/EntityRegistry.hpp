#pragma once
#include <string>
#include <vector>

using namespace std;

// Static description of one persisted entity type. The table is fixed at
// compile time; there is no runtime registration.
struct EntityInfo {
    const char *name;         // entity name used by callers, e.g. "volumes"
    const char *table;        // backing table
    const char *id_column;
    vector<string> columns;
};

// nullptr when the entity is unknown.
const EntityInfo *find_entity(const string &name);

bool entity_has_column(const EntityInfo &info, const string &column);

