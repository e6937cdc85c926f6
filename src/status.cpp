#include <tether/status.hpp>

namespace tether {

Status Status::FieldProcessingFailed(std::string field, std::string type_name,
                                     Status cause) {
  Status s(Code::kFieldProcessingFailed, std::move(field), std::move(type_name), {}, {});
  s.cause_ = std::make_shared<const Status>(std::move(cause));
  return s;
}

Status Status::UnsupportedFieldType(std::string field, std::string type_name,
                                    std::string_view kind_name) {
  return Status(Code::kUnsupportedFieldType, std::move(field), std::move(type_name), {},
                "unsupported field kind " + std::string(kind_name));
}

Status Status::InvalidReference(std::string field, std::string type_name,
                                std::string message) {
  return Status(Code::kInvalidReference, std::move(field), std::move(type_name), {},
                std::move(message));
}

Status Status::ReferenceSavingFailed(std::string field, std::string type_name,
                                     Status cause) {
  Status s(Code::kReferenceSavingFailed, std::move(field), std::move(type_name), {}, {});
  s.cause_ = std::make_shared<const Status>(std::move(cause));
  return s;
}

Status Status::RecordAlreadyExists(std::string identity, std::string type_name) {
  return Status(Code::kRecordAlreadyExists, {}, std::move(type_name), std::move(identity), {});
}

Status Status::RecordDoesNotExist(std::string identity, std::string type_name) {
  return Status(Code::kRecordDoesNotExist, {}, std::move(type_name), std::move(identity), {});
}

Status Status::RecordNotFound(std::string identity, std::string type_name) {
  return Status(Code::kRecordNotFound, {}, std::move(type_name), std::move(identity), {});
}

Status Status::MappingError(std::string type_name, std::string field,
                            std::string message) {
  return Status(Code::kMappingError, std::move(field), std::move(type_name), {},
                std::move(message));
}

Status Status::CircularReferenceRejected(std::string identity, std::string type_name) {
  return Status(Code::kCircularReferenceRejected, {}, std::move(type_name),
                std::move(identity), {});
}

Status Status::StoreOperationFailed(std::string operation,
                                    const rocksdb::Status& store_status,
                                    std::string identity) {
  Status s(Code::kStoreOperationFailed, {}, {}, std::move(identity), std::move(operation));
  s.store_status_ = store_status;
  return s;
}

Status Status::InvalidArgument(std::string message) {
  return Status(Code::kInvalidArgument, {}, {}, {}, std::move(message));
}

Status Status::FromStore(std::string operation, const rocksdb::Status& s,
                         std::string identity, std::string type_name) {
  if (s.ok()) return OK();
  if (s.IsNotFound()) return RecordNotFound(std::move(identity), std::move(type_name));
  Status out = StoreOperationFailed(std::move(operation), s, std::move(identity));
  out.type_name_ = std::move(type_name);
  return out;
}

bool Status::IsCancelled() const {
  const Status& root = RootCause();
  return root.code_ == Code::kStoreOperationFailed &&
         root.store_status_.IsAborted() &&
         root.store_status_.ToString().find("cancelled") != std::string::npos;
}

const Status& Status::RootCause() const {
  const Status* s = this;
  while (s->cause_) s = s->cause_.get();
  return *s;
}

std::string_view Status::CodeName(Code code) {
  switch (code) {
    case Code::kOk: return "OK";
    case Code::kFieldProcessingFailed: return "FieldProcessingFailed";
    case Code::kUnsupportedFieldType: return "UnsupportedFieldType";
    case Code::kInvalidReference: return "InvalidReference";
    case Code::kReferenceSavingFailed: return "ReferenceSavingFailed";
    case Code::kRecordAlreadyExists: return "RecordAlreadyExists";
    case Code::kRecordDoesNotExist: return "RecordDoesNotExist";
    case Code::kRecordNotFound: return "RecordNotFound";
    case Code::kMappingError: return "MappingError";
    case Code::kCircularReferenceRejected: return "CircularReferenceRejected";
    case Code::kStoreOperationFailed: return "StoreOperationFailed";
    case Code::kInvalidArgument: return "InvalidArgument";
  }
  return "Unknown";
}

std::string Status::ToString() const {
  if (ok()) return "OK";

  std::string out(CodeName(code_));
  if (!field_.empty()) out += " field '" + field_ + "'";
  if (!type_name_.empty()) out += (field_.empty() ? " type " : " of ") + type_name_;
  if (!identity_.empty()) out += " identity " + identity_;
  if (!message_.empty()) out += ": " + message_;
  if (code_ == Code::kStoreOperationFailed) out += " (" + store_status_.ToString() + ")";
  if (cause_) out += " <- " + cause_->ToString();
  return out;
}

}  // namespace tether
