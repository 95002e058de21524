#pragma once

namespace bridgewatch::db {

/*
  Handle on the physical store connection behind a Repository.

  Reconnect() closes whatever is open and establishes a fresh connection,
  throwing db::StoreUnavailable when the store cannot be reached. After
  Close() every Begin() fails with db::StoreUnavailable until Reconnect().
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual bool IsHealthy() = 0;

  virtual void Reconnect() = 0;

  virtual void Close() = 0;
};

} // namespace bridgewatch::db
