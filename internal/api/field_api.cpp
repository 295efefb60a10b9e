#include "field_api.hpp"

#include "fieldsync/v1.hpp"
#include "internal/api/http_error.hpp"
#include "internal/api/json_body.hpp"
#include "internal/codec/multipart.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/url.hpp"

namespace fieldsync::api {

namespace pb = fieldsync::v1;

using transport::Request;
using transport::Response;

namespace {

constexpr const char* kActorHeader       = "X-Actor-Id";
constexpr const char* kIdempotencyHeader = "Idempotency-Key";

void FillPhotoView(const db::model::PhotoRecord& photo, pb::PhotoView* view) {
  view->set_id(photo.id);
  view->set_type(std::string(model::ToString(photo.type)));
  view->set_content_type(photo.content_type);
  view->set_url(photo.storage_path);
  view->set_size_bytes(photo.size_bytes);
  view->set_uploaded_at(util::FormatUnixMillis(photo.uploaded_at_ms));
  view->set_uploaded_by(photo.uploaded_by);
}

void FillJobView(const db::model::JobRecord& job, const std::vector<db::model::PhotoRecord>& photos,
                 pb::JobView* view) {
  view->set_id(job.id);
  view->set_status(std::string(model::ToString(job.status)));
  view->set_scheduled_date(job.scheduled_date);
  view->set_started_at(util::FormatUnixMillis(job.started_at_ms));
  view->set_completed_at(util::FormatUnixMillis(job.completed_at_ms));
  view->set_skip_reason(job.skip_reason);
  view->set_notes(job.notes);
  view->set_version(job.version);
  for (const auto& photo : photos) {
    FillPhotoView(photo, view->add_photos());
  }
}

std::string TransitionMessage(model::JobStatus status) {
  switch (status) {
    case model::JobStatus::kCompleted:
      return "Job completed successfully";
    case model::JobStatus::kSkipped:
      return "Job skipped successfully";
    default:
      return "Job updated successfully";
  }
}

Response MethodNotAllowed() {
  pb::ErrorBody body;
  body.set_error("Method not allowed");
  return JsonResponse(405, body);
}

Response RouteNotFound(const std::string& path) {
  pb::ErrorBody body;
  body.set_error("No route for " + path);
  return JsonResponse(404, body);
}

} // namespace

FieldApi::FieldApi(std::shared_ptr<lifecycle::JobLifecycle> lifecycle) : lifecycle_(std::move(lifecycle)) {
}

Response FieldApi::Handle(const Request& request) {
  try {
    return Route(request);
  } catch (const std::exception& e) {
    const auto response = ToHttpResponse(e);
    if (response.status >= 500) {
      FIELDSYNC_LOG_ERROR("request failed", {observability::StringField("method", request.method),
                                             observability::StringField("url", request.url),
                                             observability::StringField("error", e.what())});
    } else {
      FIELDSYNC_LOG_DEBUG("request rejected", {observability::StringField("url", request.url),
                                               observability::IntField("status", response.status),
                                               observability::StringField("error", e.what())});
    }
    return response;
  }
}

Response FieldApi::Route(const Request& request) {
  const auto url      = util::ParseUrl(request.url);
  const auto segments = util::SplitPath(url.path);

  if (segments.size() < 4 || segments[0] != "api" || segments[1] != "field" || segments[2] != "job") {
    return RouteNotFound(url.path);
  }

  const auto& job_id = segments[3];
  const auto  method = util::ToLower(request.method);
  const auto  actor  = transport::FindHeader(request.headers, kActorHeader).value_or("");

  auto require_actor = [&] {
    if (actor.empty()) {
      throw util::InvalidArgument(std::string(kActorHeader) + " header is required");
    }
  };

  if (segments.size() == 4) {
    if (method == "get") return GetJob(job_id);
    if (method == "put") {
      require_actor();
      return TransitionJob(job_id, request, actor);
    }
    return MethodNotAllowed();
  }

  if (segments.size() == 5 && segments[4] == "photos") {
    if (method == "get") return ListPhotos(job_id);
    if (method == "post") {
      require_actor();
      return UploadPhoto(job_id, request, actor);
    }
    return MethodNotAllowed();
  }

  if (segments.size() == 5 && segments[4] == "audit") {
    if (method == "get") return ListAudit(job_id);
    return MethodNotAllowed();
  }

  return RouteNotFound(url.path);
}

Response FieldApi::GetJob(const std::string& job_id) {
  const auto snapshot = lifecycle_->GetJob(job_id);

  pb::JobResponse response;
  FillJobView(snapshot.job, snapshot.photos, response.mutable_job());
  return JsonResponse(200, response);
}

Response FieldApi::TransitionJob(const std::string& job_id, const Request& request, const std::string& actor) {
  pb::TransitionJobBody body;
  ParseJsonBody(request.body, &body);

  lifecycle::TransitionRequest transition;
  transition.job_id       = job_id;
  transition.actor        = actor;
  transition.skip_reason  = body.skip_reason();
  transition.operation_id = transport::FindHeader(request.headers, kIdempotencyHeader).value_or("");
  if (!body.notes().empty()) transition.notes = body.notes();

  if (!body.action().empty()) {
    auto target = model::StatusForAction(body.action());
    if (!target) throw util::InvalidArgument("Invalid action. Use: en_route, start, complete, skip");
    transition.target = *target;
  } else if (!body.status().empty()) {
    auto target = model::ParseJobStatus(body.status());
    if (!target) throw util::InvalidArgument("Invalid status '" + body.status() + "'");
    transition.target = *target;
  } else {
    throw util::InvalidArgument("Action is required");
  }

  const auto result = lifecycle_->Transition(transition);

  pb::JobResponse response;
  FillJobView(result.job, lifecycle_->ListPhotos(job_id), response.mutable_job());
  response.set_message(result.duplicate ? "Job already updated" : TransitionMessage(result.job.status));
  return JsonResponse(200, response);
}

Response FieldApi::ListPhotos(const std::string& job_id) {
  pb::PhotoListResponse response;
  for (const auto& photo : lifecycle_->ListPhotos(job_id)) {
    FillPhotoView(photo, response.add_photos());
  }
  return JsonResponse(200, response);
}

Response FieldApi::UploadPhoto(const std::string& job_id, const Request& request, const std::string& actor) {
  const auto content_type = transport::FindHeader(request.headers, "Content-Type").value_or("");
  const auto boundary     = codec::BoundaryFromContentType(content_type);
  if (!boundary) throw util::InvalidArgument("Expected multipart/form-data body");

  lifecycle::PhotoUpload upload;
  upload.job_id          = job_id;
  upload.actor           = actor;
  upload.idempotency_key = transport::FindHeader(request.headers, kIdempotencyHeader).value_or("");

  bool has_photo = false;
  for (auto& part : codec::ParseMultipartBody(request.body, *boundary)) {
    if (part.name == "photo") {
      upload.content_type = part.content_type;
      upload.bytes        = std::move(part.data);
      has_photo           = true;
    } else if (part.name == "type") {
      upload.type = part.data;
    }
  }
  if (!has_photo) throw util::InvalidArgument("No photo file provided");

  const auto result = lifecycle_->AttachPhoto(upload);

  pb::PhotoResponse response;
  FillPhotoView(result.photo, response.mutable_photo());
  response.set_duplicate(result.duplicate);
  response.set_message(result.duplicate ? "Photo already uploaded" : "Photo uploaded successfully");
  return JsonResponse(result.duplicate ? 200 : 201, response);
}

Response FieldApi::ListAudit(const std::string& job_id) {
  pb::AuditResponse response;
  for (const auto& entry : lifecycle_->ListAudit(job_id)) {
    auto* view = response.add_entries();
    view->set_previous_status(std::string(model::ToString(entry.previous_status)));
    view->set_new_status(std::string(model::ToString(entry.new_status)));
    view->set_actor(entry.actor);
    view->set_at(util::FormatUnixMillis(entry.at_ms));
    view->set_skip_reason(entry.skip_reason);
    view->set_operation_id(entry.operation_id);
  }
  return JsonResponse(200, response);
}

} // namespace fieldsync::api
