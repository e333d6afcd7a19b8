#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "../../client/src/api_types.h"
#include "../../client/src/conversion_client.h"
#include "../../client/src/errors.h"
#include "../../client/src/format_catalog.h"
#include "../../client/src/job_tracker.h"
#include "../../client/src/resume_store.h"
#include "../../client/src/transport.h"
#include "../../client/src/upload_session.h"
#include "../../common/config.h"
#include "../../common/logger.h"

using json = nlohmann::json;
namespace ch = converthub::client;

namespace {

struct ConvertArgs {
  std::string input;
  std::string target_format;
  std::optional<int> quality;
  std::optional<std::string> resolution;
  std::optional<std::string> bitrate;
  std::optional<int> sample_rate;
  std::optional<std::string> language;
  std::optional<std::string> webhook_url;
  std::optional<std::string> output_filename;
  std::optional<std::string> download_to;
  std::optional<std::uint64_t> chunk_size_mb;
  std::optional<std::string> resume_session;
  bool wait = false;
};

struct JobArgs {
  std::string job_id;
  std::string output;
  bool watch = false;
};

struct FormatArgs {
  std::string from;
  std::string check;
};

ch::ConversionOptions OptionsFrom(const ConvertArgs &args) {
  ch::ConversionOptions options;
  options.quality = args.quality;
  options.resolution = args.resolution;
  options.bitrate = args.bitrate;
  options.sample_rate = args.sample_rate;
  if (args.language) {
    options.extra["language"] = *args.language;
  }
  return options;
}

void PrintSubmission(const ch::JobSubmission &submission) {
  std::cout << "job " << submission.job_id << " " << ch::ToString(submission.status)
            << (submission.cached ? " (cached)" : "") << std::endl;
}

void PrintJob(const ch::JobInfo &info) {
  json out{{"job_id", info.job_id}, {"status", ch::ToString(info.status)}};
  if (!info.source_format.empty()) {
    out["source_format"] = info.source_format;
  }
  if (!info.target_format.empty()) {
    out["target_format"] = info.target_format;
  }
  if (info.result) {
    out["result"] = {{"download_url", info.result->download_url},
                     {"format", info.result->format},
                     {"file_size", info.result->file_size},
                     {"expires_at", info.result->expires_at}};
  }
  if (info.error) {
    out["error"] = {{"code", info.error->code}, {"message", info.error->message}};
  }
  std::cout << out.dump(2) << std::endl;
}

// Waits for the job and optionally fetches the result.
int FollowJob(ch::JobTracker &tracker, const std::string &job_id, const std::optional<std::string> &download_to) {
  const auto status = tracker.Wait(job_id);
  std::cout << "job " << job_id << " " << ch::ToString(status) << std::endl;
  if (status != ch::JobStatus::kCompleted) {
    PrintJob(tracker.Describe(job_id));
    return 1;
  }
  if (download_to) {
    const auto bytes = tracker.DownloadToFile(job_id, *download_to);
    std::cout << "saved " << bytes << " bytes to " << *download_to << std::endl;
  }
  return 0;
}

int RunUpload(const converthub::config::ClientConfig &config, ch::TransportClient &transport,
              ch::JobTracker &tracker, const ConvertArgs &args) {
  auto options = config.upload;
  if (args.chunk_size_mb) {
    options.chunk_size = *args.chunk_size_mb * 1024 * 1024;
  }
  options.webhook_url = args.webhook_url;
  options.conversion_options = OptionsFrom(args);
  auto store = std::make_shared<ch::FileResumeStore>(config.resume_directory);
  auto source = std::make_shared<ch::FileChunkSource>(args.input);

  std::unique_ptr<ch::UploadSession> session;
  if (args.resume_session) {
    session = ch::UploadSession::Resume(transport, store, source, *args.resume_session, options);
  } else {
    session = ch::UploadSession::Start(transport, store, source, args.target_format, options);
  }
  std::cout << "session " << session->session_id() << std::endl;
  const auto submission = session->Run([](const ch::UploadProgress &progress) {
    const double percent = progress.total_bytes == 0
                               ? 100.0
                               : 100.0 * static_cast<double>(progress.bytes_transferred) /
                                     static_cast<double>(progress.total_bytes);
    std::cerr << "\rpart " << progress.parts_acknowledged << "/" << progress.total_parts << " " << std::fixed
              << std::setprecision(1) << percent << "%" << std::flush;
  });
  std::cerr << std::endl;
  store->Remove(session->session_id());
  PrintSubmission(submission);
  return args.wait || args.download_to ? FollowJob(tracker, submission.job_id, args.download_to) : 0;
}

int RunConvert(const converthub::config::ClientConfig &config, ch::TransportClient &transport,
               ch::JobTracker &tracker, const ConvertArgs &args) {
  ch::FileChunkSource file(args.input);
  if (file.size() > ch::kMaxDirectUploadBytes) {
    std::cerr << args.input << " exceeds the direct upload limit, switching to a chunked upload" << std::endl;
    return RunUpload(config, transport, tracker, args);
  }
  ch::ConversionRequest request;
  request.source = ch::LocalFileSource{file.name(), file.Read(0, file.size())};
  request.target_format = args.target_format;
  request.options = OptionsFrom(args);
  request.webhook_url = args.webhook_url;
  request.output_filename = args.output_filename;
  ch::ConversionClient conversions(transport);
  const auto submission = conversions.Submit(request);
  PrintSubmission(submission);
  return args.wait || args.download_to ? FollowJob(tracker, submission.job_id, args.download_to) : 0;
}

int RunConvertUrl(ch::TransportClient &transport, ch::JobTracker &tracker, const ConvertArgs &args) {
  ch::ConversionRequest request;
  request.source = ch::RemoteUrlSource{args.input};
  request.target_format = args.target_format;
  request.options = OptionsFrom(args);
  request.webhook_url = args.webhook_url;
  request.output_filename = args.output_filename;
  ch::ConversionClient conversions(transport);
  const auto submission = conversions.Submit(request);
  PrintSubmission(submission);
  return args.wait || args.download_to ? FollowJob(tracker, submission.job_id, args.download_to) : 0;
}

int RunFormats(ch::TransportClient &transport, const FormatArgs &args) {
  ch::FormatCatalog catalog(transport);
  if (!args.check.empty()) {
    const auto colon = args.check.find(':');
    if (colon == std::string::npos) {
      std::cerr << "--check expects FROM:TO" << std::endl;
      return 2;
    }
    const auto from = args.check.substr(0, colon);
    const auto to = args.check.substr(colon + 1);
    const bool supported = catalog.IsSupported(from, to);
    std::cout << from << " -> " << to << (supported ? " supported" : " not supported") << std::endl;
    return supported ? 0 : 1;
  }
  if (!args.from.empty()) {
    for (const auto &target : catalog.SupportedConversions(args.from)) {
      std::cout << target << '\n';
    }
    return 0;
  }
  for (const auto &[category, formats] : catalog.ListFormats()) {
    std::cout << category << ":";
    for (const auto &format : formats) {
      std::cout << ' ' << format.extension;
    }
    std::cout << '\n';
  }
  return 0;
}

void AddConvertOptions(CLI::App *command, ConvertArgs &args) {
  command->add_option("target_format", args.target_format, "Target format")->required();
  command->add_option("--quality", args.quality, "Output quality (1-100)")->check(CLI::Range(1, 100));
  command->add_option("--resolution", args.resolution, "Output resolution, e.g. 1920x1080");
  command->add_option("--bitrate", args.bitrate, "Audio/video bitrate, e.g. 320k");
  command->add_option("--sample-rate", args.sample_rate, "Audio sample rate");
  command->add_option("--language", args.language, "OCR language, e.g. eng");
  command->add_option("--webhook", args.webhook_url, "Webhook URL for notifications");
  command->add_option("--output", args.output_filename, "Output filename on the service");
  command->add_option("--download", args.download_to, "Wait and save the result to PATH");
  command->add_flag("--wait", args.wait, "Wait until the job finishes");
}

}  // namespace

int main(int argc, char **argv) {
  CLI::App app{"ConvertHub file conversion client"};
  app.require_subcommand(1);

  ConvertArgs convert_args;
  auto *convert = app.add_subcommand("convert", "Convert a local file");
  convert->add_option("input_file", convert_args.input, "Path to the input file")->required()->check(CLI::ExistingFile);
  AddConvertOptions(convert, convert_args);

  auto *convert_url = app.add_subcommand("convert-url", "Convert a file the service fetches from a URL");
  convert_url->add_option("url", convert_args.input, "URL of the file to convert")->required();
  AddConvertOptions(convert_url, convert_args);

  auto *upload = app.add_subcommand("upload", "Upload a large file in chunks and convert it");
  upload->add_option("input_file", convert_args.input, "Path to the input file")->required()->check(CLI::ExistingFile);
  AddConvertOptions(upload, convert_args);
  upload->add_option("--chunk-size", convert_args.chunk_size_mb, "Chunk size in MB")->check(CLI::PositiveNumber);
  upload->add_option("--resume", convert_args.resume_session, "Resume an interrupted upload session");

  JobArgs job_args;
  auto *status = app.add_subcommand("status", "Show a job's status");
  status->add_option("job_id", job_args.job_id, "Job id")->required();
  status->add_flag("--watch", job_args.watch, "Wait until the job finishes");
  auto *cancel = app.add_subcommand("cancel", "Cancel a queued or running job");
  cancel->add_option("job_id", job_args.job_id, "Job id")->required();
  auto *download = app.add_subcommand("download", "Download a finished conversion");
  download->add_option("job_id", job_args.job_id, "Job id")->required();
  download->add_option("--output", job_args.output, "Output path");
  auto *remove = app.add_subcommand("delete", "Delete a conversion's stored files");
  remove->add_option("job_id", job_args.job_id, "Job id")->required();

  FormatArgs format_args;
  auto *formats = app.add_subcommand("formats", "List formats and conversions");
  formats->add_option("--from", format_args.from, "List conversions from this format");
  formats->add_option("--check", format_args.check, "Check a conversion, FROM:TO");

  CLI11_PARSE(app, argc, argv);

  auto &logger = converthub::logging::ServiceLogger::Instance("cli");
  try {
    const auto config = converthub::config::LoadClientConfigFromEnv();
    if (config.api_key.empty()) {
      std::cerr << "CONVERTHUB_API_KEY is not set" << std::endl;
      return 2;
    }
    ch::TransportClient transport(std::make_shared<ch::HttplibTransport>(config.timeouts),
                                  config.ToTransportOptions());
    ch::TrackerOptions tracker_options;
    tracker_options.wait = config.wait;
    ch::JobTracker tracker(transport, nullptr, tracker_options);

    if (*convert) {
      return RunConvert(config, transport, tracker, convert_args);
    }
    if (*convert_url) {
      return RunConvertUrl(transport, tracker, convert_args);
    }
    if (*upload) {
      return RunUpload(config, transport, tracker, convert_args);
    }
    if (*status) {
      if (job_args.watch) {
        return FollowJob(tracker, job_args.job_id, std::nullopt);
      }
      PrintJob(tracker.Describe(job_args.job_id));
      return 0;
    }
    if (*cancel) {
      const auto outcome = tracker.Cancel(job_args.job_id);
      std::cout << "job " << job_args.job_id
                << (outcome == ch::CancelOutcome::kCancelled ? " cancelled" : " already finished") << std::endl;
      return 0;
    }
    if (*download) {
      const std::string output = job_args.output.empty() ? job_args.job_id + ".out" : job_args.output;
      const auto bytes = tracker.DownloadToFile(job_args.job_id, output);
      std::cout << "saved " << bytes << " bytes to " << output << std::endl;
      return 0;
    }
    if (*remove) {
      const auto outcome = tracker.Delete(job_args.job_id);
      std::cout << "job " << job_args.job_id
                << (outcome == ch::DeleteOutcome::kDeleted ? " deleted" : " already deleted") << std::endl;
      return 0;
    }
    if (*formats) {
      return RunFormats(transport, format_args);
    }
  } catch (const ch::ClientError &ex) {
    logger.Error("command_failed", ex.what());
    std::cerr << "error: " << ex.what() << std::endl;
    return 1;
  } catch (const std::exception &ex) {
    logger.Error("command_failed", ex.what());
    std::cerr << "error: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
