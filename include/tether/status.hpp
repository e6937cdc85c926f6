#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace tether {

/**
 * Result of every fallible tether operation.
 *
 * Modeled on rocksdb::Status: cheap to copy, ok() on success, one Is*()
 * predicate per failure kind. Failures keep the field name, type name and
 * identity they originated from, and the wrapping kinds
 * (FieldProcessingFailed, ReferenceSavingFailed) keep the nested cause so a
 * caller can walk down to the root failure without inspecting internals.
 */
class Status {
 public:
  enum class Code : uint8_t {
    kOk = 0,
    kFieldProcessingFailed,
    kUnsupportedFieldType,
    kInvalidReference,
    kReferenceSavingFailed,
    kRecordAlreadyExists,
    kRecordDoesNotExist,
    kRecordNotFound,
    kMappingError,
    kCircularReferenceRejected,
    kStoreOperationFailed,
    kInvalidArgument,
  };

  Status() = default;

  static Status OK() { return Status(); }

  static Status FieldProcessingFailed(std::string field, std::string type_name,
                                      Status cause);
  static Status UnsupportedFieldType(std::string field, std::string type_name,
                                     std::string_view kind_name);
  static Status InvalidReference(std::string field, std::string type_name,
                                 std::string message = {});
  static Status ReferenceSavingFailed(std::string field, std::string type_name,
                                      Status cause);
  static Status RecordAlreadyExists(std::string identity, std::string type_name);
  static Status RecordDoesNotExist(std::string identity, std::string type_name);
  static Status RecordNotFound(std::string identity, std::string type_name);
  static Status MappingError(std::string type_name, std::string field,
                             std::string message);
  static Status CircularReferenceRejected(std::string identity,
                                          std::string type_name);
  static Status StoreOperationFailed(std::string operation,
                                     const rocksdb::Status& store_status,
                                     std::string identity = {});
  static Status InvalidArgument(std::string message);

  /**
   * Translate a backing-store status. NotFound becomes RecordNotFound, any
   * other failure becomes StoreOperationFailed wrapping the original.
   */
  static Status FromStore(std::string operation, const rocksdb::Status& s,
                          std::string identity = {}, std::string type_name = {});

  bool ok() const { return code_ == Code::kOk; }
  Code code() const { return code_; }

  bool IsFieldProcessingFailed() const { return code_ == Code::kFieldProcessingFailed; }
  bool IsUnsupportedFieldType() const { return code_ == Code::kUnsupportedFieldType; }
  bool IsInvalidReference() const { return code_ == Code::kInvalidReference; }
  bool IsReferenceSavingFailed() const { return code_ == Code::kReferenceSavingFailed; }
  bool IsRecordAlreadyExists() const { return code_ == Code::kRecordAlreadyExists; }
  bool IsRecordDoesNotExist() const { return code_ == Code::kRecordDoesNotExist; }
  bool IsRecordNotFound() const { return code_ == Code::kRecordNotFound; }
  bool IsMappingError() const { return code_ == Code::kMappingError; }
  bool IsCircularReferenceRejected() const { return code_ == Code::kCircularReferenceRejected; }
  bool IsStoreOperationFailed() const { return code_ == Code::kStoreOperationFailed; }
  bool IsInvalidArgument() const { return code_ == Code::kInvalidArgument; }

  /** True if the root cause is a cancelled store call. */
  bool IsCancelled() const;

  const std::string& field() const { return field_; }
  const std::string& type_name() const { return type_name_; }
  const std::string& identity() const { return identity_; }
  const std::string& message() const { return message_; }

  /** Nested failure for the wrapping kinds, nullptr otherwise. */
  const Status* cause() const { return cause_.get(); }

  /** Innermost status in the cause chain (this status if it has no cause). */
  const Status& RootCause() const;

  /** The wrapped backing-store status (OK unless StoreOperationFailed). */
  const rocksdb::Status& store_status() const { return store_status_; }

  std::string ToString() const;

  static std::string_view CodeName(Code code);

 private:
  Status(Code code, std::string field, std::string type_name,
         std::string identity, std::string message)
      : code_(code),
        field_(std::move(field)),
        type_name_(std::move(type_name)),
        identity_(std::move(identity)),
        message_(std::move(message)) {}

  Code code_ = Code::kOk;
  std::string field_;
  std::string type_name_;
  std::string identity_;
  std::string message_;
  std::shared_ptr<const Status> cause_;
  rocksdb::Status store_status_;
};

}  // namespace tether
