#pragma once

#include <string>

namespace keysync::db::model {

/*
  One saved layout revision.

  data is the configurator's "Data" JSON object, stored as a BLOB exactly as
  received.
*/
struct RevisionRecord {
  std::string revision_id;
  std::string data;
};

} // namespace keysync::db::model
