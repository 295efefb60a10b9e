#include <cassert>
#include <iostream>
#include <string>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "fieldsync/v1/queue.pb.h"
#include "internal/codec/multipart.hpp"
#include "internal/codec/upload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldsync::codec::Blob;
using fieldsync::codec::BodyFormat;
using fieldsync::codec::WriteRequest;

std::string BinaryPhoto() {
  std::string bytes = "\xff\xd8\xff\xe0";
  bytes.push_back('\0');
  bytes += "JFIF\r\n--not-a-boundary\r\n";
  bytes.push_back('\x7f');
  return bytes;
}

WriteRequest PhotoUpload() {
  WriteRequest request;
  request.method   = "POST";
  request.endpoint = "/api/field/job/42/photos";
  request.format   = BodyFormat::kMultipart;
  request.AddBlob("photo", Blob{"front yard.jpg", "image/jpeg", BinaryPhoto()});
  request.AddText("type", "before");
  return request;
}

template <typename Fn>
bool ThrowsCorrupt(Fn&& fn) {
  try {
    fn();
  } catch (const fieldsync::util::CorruptRecord&) {
    return true;
  }
  return false;
}

std::string ToJson(const fieldsync::v1::QueuedPayload& payload) {
  std::string text;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &text);
  assert(status.ok());
  (void)status;
  return text;
}

void TestBinaryPhotoSurvivesPersistence() {
  const auto original = PhotoUpload();
  const auto decoded  = fieldsync::codec::Decode(fieldsync::codec::Encode(original));

  assert(decoded == original);
  const auto* photo = decoded.Find("photo");
  assert(photo != nullptr && photo->IsBlob());
  assert(std::get<Blob>(photo->value).data == BinaryPhoto());
}

void TestFieldOrderIsPreserved() {
  WriteRequest request;
  request.endpoint = "/api/field/job/7";
  request.method   = "PUT";
  request.format   = BodyFormat::kJson;
  request.AddText("status", "SKIPPED").AddText("skipReason", "gate locked").AddText("notes", "");

  const auto decoded = fieldsync::codec::Decode(fieldsync::codec::Encode(request));
  assert(decoded.fields.size() == 3);
  assert(decoded.fields[0].name == "status");
  assert(decoded.fields[1].name == "skipReason");
  assert(decoded.fields[2].name == "notes");
  assert(std::get<std::string>(decoded.fields[2].value).empty());
}

void TestGarbageIsCorrupt() {
  assert(ThrowsCorrupt([] { (void)fieldsync::codec::Decode("{not json"); }));
  assert(ThrowsCorrupt([] { (void)fieldsync::codec::Decode(""); }));
}

void TestTruncatedBlobIsCorrupt() {
  fieldsync::v1::QueuedPayload payload;
  const bool parsed = google::protobuf::util::JsonStringToMessage(fieldsync::codec::Encode(PhotoUpload()), &payload).ok();
  assert(parsed);

  auto* blob = payload.mutable_fields(0)->mutable_blob();
  blob->set_data(blob->data().substr(0, 3));
  const auto text = ToJson(payload);

  assert(ThrowsCorrupt([&] { (void)fieldsync::codec::Decode(text); }));
}

void TestUnknownVersionIsCorrupt() {
  fieldsync::v1::QueuedPayload payload;
  const bool parsed = google::protobuf::util::JsonStringToMessage(fieldsync::codec::Encode(PhotoUpload()), &payload).ok();
  assert(parsed);
  payload.set_format_version(2);
  const auto text = ToJson(payload);

  assert(ThrowsCorrupt([&] { (void)fieldsync::codec::Decode(text); }));
}

void TestFieldWithoutValueIsCorrupt() {
  fieldsync::v1::QueuedPayload payload;
  const bool parsed = google::protobuf::util::JsonStringToMessage(fieldsync::codec::Encode(PhotoUpload()), &payload).ok();
  assert(parsed);
  payload.add_fields()->set_name("dangling");
  const auto text = ToJson(payload);

  assert(ThrowsCorrupt([&] { (void)fieldsync::codec::Decode(text); }));
}

void TestUnknownKeysAreCorrupt() {
  auto text = fieldsync::codec::Encode(PhotoUpload());
  text.insert(1, "\"surprise\":1,");
  assert(ThrowsCorrupt([&] { (void)fieldsync::codec::Decode(text); }));
}

void TestUnsendableRequestsAreRejected() {
  WriteRequest json_with_blob;
  json_with_blob.endpoint = "/api/field/job/1";
  json_with_blob.format   = BodyFormat::kJson;
  json_with_blob.AddBlob("photo", Blob{"a.jpg", "image/jpeg", "x"});

  bool threw = false;
  try {
    (void)fieldsync::codec::Encode(json_with_blob);
  } catch (const fieldsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  WriteRequest relative;
  relative.endpoint = "api/field/job/1";
  threw             = false;
  try {
    (void)fieldsync::codec::Encode(relative);
  } catch (const fieldsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMultipartRequestCarriesPartsAndIdempotencyKey() {
  const auto http = fieldsync::codec::ToHttpRequest(PhotoUpload(), "op-1");

  assert(http.method == "POST");
  assert(http.url == "/api/field/job/42/photos");
  assert(fieldsync::transport::FindHeader(http.headers, "idempotency-key") == "op-1");

  const auto content_type = fieldsync::transport::FindHeader(http.headers, "Content-Type");
  assert(content_type.has_value());
  const auto boundary = fieldsync::codec::BoundaryFromContentType(*content_type);
  assert(boundary.has_value());

  const auto parts = fieldsync::codec::ParseMultipartBody(http.body, *boundary);
  assert(parts.size() == 2);
  assert(parts[0].name == "photo");
  assert(parts[0].filename == "front yard.jpg");
  assert(parts[0].content_type == "image/jpeg");
  assert(parts[0].data == BinaryPhoto());
  assert(parts[1].name == "type");
  assert(parts[1].data == "before");
}

void TestJsonRequestBody() {
  WriteRequest request;
  request.method   = "PUT";
  request.endpoint = "/api/field/job/7";
  request.format   = BodyFormat::kJson;
  request.AddText("status", "SKIPPED").AddText("skipReason", "dog in yard");

  const auto http = fieldsync::codec::ToHttpRequest(request, "op-2");
  assert(fieldsync::transport::FindHeader(http.headers, "Content-Type") == "application/json");

  google::protobuf::Struct body;
  const bool parsed = google::protobuf::util::JsonStringToMessage(http.body, &body).ok();
  assert(parsed);
  assert(body.fields().at("status").string_value() == "SKIPPED");
  assert(body.fields().at("skipReason").string_value() == "dog in yard");
}

void TestMultipartParamEscaping() {
  std::vector<fieldsync::codec::MultipartPart> parts{{"photo", "say \"cheese\".jpg", "image/jpeg", "abc"}};
  const auto boundary = fieldsync::codec::ChooseBoundary(parts);
  const auto body     = fieldsync::codec::BuildMultipartBody(parts, boundary);

  const auto parsed = fieldsync::codec::ParseMultipartBody(body, boundary);
  assert(parsed.size() == 1);
  assert(parsed[0].filename == "say \"cheese\".jpg");
  assert(parsed[0].data == "abc");
}

void TestLiteralPercentSequencesSurvive() {
  std::vector<fieldsync::codec::MultipartPart> parts{
      {"note%0A", "100%22off%0D%25.jpg", "image/jpeg", "abc"},
      {"ratio", "", "", "50%"},
  };
  const auto boundary = fieldsync::codec::ChooseBoundary(parts);
  const auto body     = fieldsync::codec::BuildMultipartBody(parts, boundary);
  assert(body.find("filename=\"100%2522off%250D%2525.jpg\"") != std::string::npos);

  const auto parsed = fieldsync::codec::ParseMultipartBody(body, boundary);
  assert(parsed.size() == 2);
  assert(parsed[0].name == "note%0A");
  assert(parsed[0].filename == "100%22off%0D%25.jpg");
  assert(parsed[1].name == "ratio");
  assert(parsed[1].data == "50%");
}

void TestMalformedMultipartIsRejected() {
  bool threw = false;
  try {
    (void)fieldsync::codec::ParseMultipartBody("--b\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nabc", "b");
  } catch (const fieldsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestResourceKeys() {
  assert(fieldsync::codec::ResourceKeyFor("/api/field/job/42") == "job:42");
  assert(fieldsync::codec::ResourceKeyFor("/api/field/job/42/photos") == "job:42");
  assert(fieldsync::codec::ResourceKeyFor("/api/field/job/42/photos?x=1") == "job:42");
  assert(fieldsync::codec::ResourceKeyFor("/api/field/notes") == "/api/field/notes");
}

} // namespace

int main() {
  TestBinaryPhotoSurvivesPersistence();
  TestFieldOrderIsPreserved();
  TestGarbageIsCorrupt();
  TestTruncatedBlobIsCorrupt();
  TestUnknownVersionIsCorrupt();
  TestFieldWithoutValueIsCorrupt();
  TestUnknownKeysAreCorrupt();
  TestUnsendableRequestsAreRejected();
  TestMultipartRequestCarriesPartsAndIdempotencyKey();
  TestJsonRequestBody();
  TestMultipartParamEscaping();
  TestLiteralPercentSequencesSurvive();
  TestMalformedMultipartIsRejected();
  TestResourceKeys();

  std::cout << "fieldsync_unit_upload_codec: pass\n";
  return 0;
}
