#pragma once

namespace docrev::db {

/*
  Unit of work over the metadata store.

  DocumentService opens exactly one per command: create stores the
  document and all its sentences in one, edit-timestamp rewrites one
  sentence and the document's modified time in one. Until Commit() the
  store still shows the previous document; the destructor rolls back, so
  a failed .docx write leaves no half-stored record.

  Commit() on a finished transaction throws std::logic_error.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
