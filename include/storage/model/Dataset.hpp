#pragma once

#include <string>

namespace sk::storage::model {

struct DatasetID {
    std::string name, version;

    bool operator==(const DatasetID&) const = default;
};

struct DatasetPartition {
    DatasetID dataset_id;
    std::string partition;

    bool operator==(const DatasetPartition&) const = default;
};

}
