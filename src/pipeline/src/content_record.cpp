#include "content_record.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <google/protobuf/util/json_util.h>

#include "hex.hpp"
#include "scoring.hpp"
#include "utils.hpp"

namespace tad::pipeline
{
    namespace
    {
        std::uint64_t _percent(const double score)
        {
            return static_cast<std::uint64_t>(std::clamp(score, 0.0, 1.0) * 100.0);
        }
    }

    ContentRecord buildRecord(
        const chain::SubmissionEvent & event,
        const evmc::bytes32 & content_hash,
        const FetchedContent & content,
        const AnalysisResult & analysis,
        const std::optional<price::PriceQuote> & price,
        const std::chrono::system_clock::time_point stored_at)
    {
        ContentRecord record;
        record.set_content_hash(chain::bytesToHex(content_hash.bytes, sizeof(content_hash.bytes)));
        record.set_stored_at(utils::isoTimestamp(stored_at));

        TweetContent & tweet = *record.mutable_tweet();
        tweet.set_url(content.url);
        tweet.set_tweet_id(content.tweet_id);
        tweet.set_body(content.body);
        tweet.set_author(content.author);
        tweet.set_handle(content.handle);
        tweet.set_verified(content.verified);
        tweet.mutable_metrics()->set_likes(content.likes);
        tweet.mutable_metrics()->set_retweets(content.retweets);
        tweet.mutable_metrics()->set_replies(content.replies);
        tweet.set_captured_at(utils::isoTimestamp(content.captured_at));
        tweet.set_screenshot_url(content.screenshot_url);

        Analysis & analysis_msg = *record.mutable_analysis();
        if(analysis.removal)
        {
            analysis_msg.set_removal_risk(analysis.removal->score);
            analysis_msg.set_removal_analysis(analysis.removal->analysis);
        }
        if(analysis.sentiment)
        {
            analysis_msg.mutable_sentiment()->set_label(analysis.sentiment->label);
            analysis_msg.mutable_sentiment()->set_controversy(analysis.sentiment->controversy);
        }
        if(analysis.ecosystem)
        {
            analysis_msg.mutable_ecosystem()->set_token(analysis.ecosystem->token);
            analysis_msg.mutable_ecosystem()->set_confidence(analysis.ecosystem->confidence);
            analysis_msg.mutable_ecosystem()->set_chain(analysis.ecosystem->chain);
        }
        analysis_msg.set_combined_score(analysis.combined_score);

        if(price)
        {
            PriceInfo & price_msg = *record.mutable_price();
            price_msg.set_symbol(price->symbol);
            price_msg.set_price(price->price);
            price_msg.set_source(price->source);
            price_msg.set_timestamp(utils::isoTimestamp(price->timestamp));
            price_msg.set_success(price->success);
        }

        SubmissionInfo & submission = *record.mutable_submission();
        submission.set_block_number(event.block_number);
        submission.set_transaction_hash(event.transaction_hash);
        submission.set_log_index(event.log_index);
        submission.set_depositor(chain::addressToHex(event.depositor));
        submission.set_recipient(chain::addressToHex(event.recipient));
        submission.set_ip_amount(chain::bytesToHex(event.ip_amount.bytes, sizeof(event.ip_amount.bytes)));
        submission.set_emitted_at(utils::isoTimestamp(event.emitted_at));

        return record;
    }

    RegistryEntry makeRegistryEntry(
        const ContentRecord & record,
        const evmc::bytes32 & content_hash,
        const StorageReceipt & receipt,
        const chain::Address & submitter,
        const std::chrono::system_clock::time_point registered_at)
    {
        const TweetContent & tweet = record.tweet();
        const Analysis & analysis = record.analysis();

        RegistryEntry entry;
        entry.content_hash = content_hash;
        entry.url = tweet.url();
        entry.tweet_id = tweet.tweet_id();
        entry.author = tweet.author();
        entry.handle = tweet.handle();
        entry.verified = tweet.verified();
        entry.body = tweet.body();

        entry.timestamp = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(registered_at.time_since_epoch()).count());
        entry.likes = tweet.metrics().likes();
        entry.retweets = tweet.metrics().retweets();
        entry.replies = tweet.metrics().replies();
        entry.controversy_pct = _percent(analysis.combined_score());
        entry.removal_pct = analysis.has_removal_risk() ? _percent(analysis.removal_risk()) : 0;

        entry.screenshot_cid = cidFromUrl(tweet.screenshot_url());
        entry.data_cid = receipt.data_cid;
        entry.root_cid = receipt.root_cid;
        entry.deal_id = receipt.deal_id.value_or("");
        entry.ecosystem = analysis.has_ecosystem() ? analysis.ecosystem().token() : UNKNOWN_TOKEN;

        entry.submitter = submitter;
        return entry;
    }

    std::string cidFromUrl(const std::string & url)
    {
        const std::string trimmed = utils::trim(url);
        const auto slash = trimmed.find_last_of('/');
        if(slash == std::string::npos)
        {
            return trimmed;
        }
        return trimmed.substr(slash + 1);
    }
}

namespace tad::parse
{
    namespace
    {
        std::uint64_t _count(const json & json_obj, const char* name)
        {
            if(!json_obj.contains(name))
            {
                return 0;
            }

            const json & value = json_obj[name];
            if(value.is_number_unsigned())
            {
                return value.get<std::uint64_t>();
            }
            if(value.is_number_integer())
            {
                return value.get<std::int64_t>() > 0 ? static_cast<std::uint64_t>(value.get<std::int64_t>()) : 0;
            }
            if(value.is_string())
            {
                return pipeline::normalizeCount(value.get<std::string>());
            }
            return 0;
        }

        std::string _text(const json & json_obj, const char* name)
        {
            if(!json_obj.contains(name) || !json_obj[name].is_string())
            {
                return "";
            }
            return json_obj[name].get<std::string>();
        }

        std::optional<std::chrono::system_clock::time_point> _isoTime(const std::string & text)
        {
            std::tm tm{};
            std::istringstream input(text);
            input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
            if(input.fail())
            {
                return std::nullopt;
            }
            return std::chrono::system_clock::from_time_t(::timegm(&tm));
        }
    }

    template<>
    Result<std::string> parseToJson(ContentRecord record, use_protobuf_t)
    {
        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = true;
        options.preserve_proto_field_names = true;
        options.always_print_primitive_fields = true;

        std::string json_output;

        auto status = google::protobuf::util::MessageToJsonString(record, &json_output, options);

        if(!status.ok()) return std::unexpected(Error{Error::Kind::INVALID_VALUE, "invalid content record"});

        return json_output;
    }

    template<>
    Result<ContentRecord> parseFromJson(std::string json_str, use_protobuf_t)
    {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;

        ContentRecord record;

        auto status = google::protobuf::util::JsonStringToMessage(json_str, &record, options);

        if(!status.ok()) return std::unexpected(Error{Error::Kind::INVALID_VALUE, "invalid content record"});

        return record;
    }

    template<>
    Result<pipeline::FetchedContent> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "scraper output is not an object"});
        }

        if(!json_obj.contains("content") || !json_obj["content"].is_string())
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, "content not found"});
        }

        pipeline::FetchedContent content;
        content.url = _text(json_obj, "url");
        content.tweet_id = _text(json_obj, "tweet_id");
        content.body = json_obj["content"].get<std::string>();
        content.author = _text(json_obj, "user");
        content.handle = _text(json_obj, "handle");

        if(json_obj.contains("verified"))
        {
            const json & verified = json_obj["verified"];
            content.verified = verified.is_boolean() ? verified.get<bool>()
                : (verified.is_string() && utils::equalsIgnoreCase(verified.get<std::string>(), "true"));
        }

        content.likes = _count(json_obj, "likes");
        content.retweets = _count(json_obj, "retweets");
        content.replies = _count(json_obj, "replies");

        content.captured_at = _isoTime(_text(json_obj, "timestamp")).value_or(std::chrono::system_clock::now());
        content.screenshot_url = _text(json_obj, "screenshot");
        if(content.screenshot_url.empty())
        {
            content.screenshot_url = _text(json_obj, "ipfs_screenshot");
        }

        return content;
    }
}
