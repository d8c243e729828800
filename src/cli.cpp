#include "aeon/cli.hpp"
#include "aeon/config.hpp"
#include "aeon/crypto.hpp"
#include "aeon/did.hpp"
#include "aeon/did_store.hpp"
#include "aeon/json_canonicalization.hpp"
#include "aeon/log.hpp"
#include "aeon/signer.hpp"
#include "aeon/verifier.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>

namespace aeon::cli
{

	namespace
	{
		Result<nlohmann::json> read_message(const std::string &text, bool as_json)
		{
			if (!as_json)
				return nlohmann::json(text);
			try
			{
				return nlohmann::json::parse(text);
			}
			catch (const nlohmann::json::exception &e)
			{
				return std::unexpected(AeonError::parsing(std::string("Invalid JSON message: ") + e.what()));
			}
		}

		// --key wins; otherwise the key of a stored DID
		Result<std::string> resolve_key(const std::string &key_hex, const std::string &did_name, DidStore &store)
		{
			if (!key_hex.empty())
				return key_hex;
			if (did_name.empty())
				return std::unexpected(AeonError::invalid_key("Either --key or --did is required"));
			auto doc = store.load(did_name);
			if (!doc)
				return std::unexpected(doc.error());
			if (!*doc)
				return std::unexpected(AeonError::not_found("No stored DID named " + did_name));
			return (*doc)->signing_key();
		}

		int fail(const AeonError &err)
		{
			std::cerr << error_code_to_string(err.code) << ": " << err.what() << std::endl;
			return 1;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"AEON agent identity and message signing"};
		app.require_subcommand(0, 1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto keygen_cmd = app.add_subcommand("keygen", "Generate a 256-bit signing key (hex)");

		std::string create_name;
		std::string create_key;
		std::string create_metadata;
		bool create_save{false};
		auto create_cmd = app.add_subcommand("did-create", "Issue a did:aeon identity");
		create_cmd->add_option("--name", create_name, "Agent name ([a-z0-9-]+)")->required();
		create_cmd->add_option("--key", create_key, "Existing hex signing key (generated when omitted)");
		create_cmd->add_option("--metadata", create_metadata, "Metadata as JSON");
		create_cmd->add_flag("--save", create_save, "Persist the document to the DID directory");

		std::string show_name;
		bool show_secret{false};
		auto show_cmd = app.add_subcommand("did-show", "Print a stored identity document");
		show_cmd->add_option("--name", show_name, "Agent name")->required();
		show_cmd->add_flag("--show-secret", show_secret, "Include the signing key");

		auto list_cmd = app.add_subcommand("did-list", "List stored identities");

		std::string delete_name;
		auto delete_cmd = app.add_subcommand("did-delete", "Delete a stored identity");
		delete_cmd->add_option("--name", delete_name, "Agent name")->required();

		std::string key_hex;
		std::string did_name;
		std::string message_text;
		bool message_json{false};
		std::string sign_timestamp;
		std::string sign_nonce;
		auto sign_cmd = app.add_subcommand("sign", "Sign a message");
		sign_cmd->add_option("--key", key_hex, "Hex signing key");
		sign_cmd->add_option("--did", did_name, "Use the key of a stored DID");
		sign_cmd->add_option("--message", message_text, "Message text")->required();
		sign_cmd->add_flag("--json", message_json, "Treat the message as JSON");
		sign_cmd->add_option("--timestamp", sign_timestamp, "Explicit timestamp (epoch ms)");
		sign_cmd->add_option("--nonce", sign_nonce, "Explicit nonce");

		std::string signature_text;
		std::optional<std::int64_t> max_age;
		auto verify_cmd = app.add_subcommand("verify", "Verify a signature");
		verify_cmd->add_option("--key", key_hex, "Hex signing key");
		verify_cmd->add_option("--did", did_name, "Use the key of a stored DID");
		verify_cmd->add_option("--signature", signature_text, "Signature JSON")->required();
		verify_cmd->add_option("--message", message_text, "Message text")->required();
		verify_cmd->add_flag("--json", message_json, "Treat the message as JSON");
		verify_cmd->add_option("--max-age", max_age, "Maximum signature age in ms");

		auto canon_cmd = app.add_subcommand("canonicalize", "Print the canonical form of a JSON message");
		canon_cmd->add_option("--message", message_text, "JSON message")->required();

		auto cfg_cmd = app.add_subcommand("config-print", "Print the effective config as JSON");

		CLI11_PARSE(app, argc, argv);

		auto cfg = config_path.empty() ? ConfigLoader::from_environment() : ConfigLoader::load(config_path);
		if (!cfg)
			return fail(cfg.error());
		if (auto lvl = log::set_level(cfg->logging.level); !lvl)
			return fail(lvl.error());

		FileDidStore store(cfg->storage.did_directory.empty()
							   ? FileDidStore::default_directory()
							   : std::filesystem::path(cfg->storage.did_directory));

		if (*keygen_cmd)
		{
			std::cout << crypto::KeyMaterial::generate() << std::endl;
			return 0;
		}

		if (*create_cmd)
		{
			std::optional<nlohmann::json> metadata;
			if (!create_metadata.empty())
			{
				auto parsed = read_message(create_metadata, true);
				if (!parsed)
					return fail(parsed.error());
				metadata = *parsed;
			}
			std::optional<std::string> key;
			if (!create_key.empty())
				key = create_key;

			auto doc = DidIssuer().create(create_name, key, metadata);
			if (!doc)
				return fail(doc.error());
			if (create_save)
			{
				if (auto saved = store.save(*doc); !saved)
					return fail(saved.error());
			}
			std::cout << doc->to_json(true).dump(2) << std::endl;
			return 0;
		}

		if (*show_cmd)
		{
			auto doc = store.load(show_name);
			if (!doc)
				return fail(doc.error());
			if (!*doc)
				return fail(AeonError::not_found("No stored DID named " + show_name));
			std::cout << (*doc)->to_json(show_secret).dump(2) << std::endl;
			return 0;
		}

		if (*list_cmd)
		{
			for (const auto &doc : store.list())
			{
				std::cout << doc.did() << std::endl;
			}
			return 0;
		}

		if (*delete_cmd)
		{
			auto removed = store.remove(delete_name);
			if (!removed)
				return fail(removed.error());
			if (!*removed)
				return fail(AeonError::not_found("No stored DID named " + delete_name));
			return 0;
		}

		if (*sign_cmd)
		{
			auto key = resolve_key(key_hex, did_name, store);
			if (!key)
				return fail(key.error());
			auto message = read_message(message_text, message_json);
			if (!message)
				return fail(message.error());

			SignOptions options;
			if (!sign_timestamp.empty())
				options.timestamp = sign_timestamp;
			if (!sign_nonce.empty())
				options.nonce = sign_nonce;

			auto sig = MessageSigner().sign(*key, *message, options);
			crypto::secure_wipe(*key);
			if (!sig)
				return fail(sig.error());
			std::cout << sig->to_json().dump() << std::endl;
			return 0;
		}

		if (*verify_cmd)
		{
			auto key = resolve_key(key_hex, did_name, store);
			if (!key)
				return fail(key.error());
			auto message = read_message(message_text, message_json);
			if (!message)
				return fail(message.error());
			auto sig_json = read_message(signature_text, true);
			if (!sig_json)
				return fail(sig_json.error());
			auto sig = Signature::from_json(*sig_json);
			if (!sig)
				return fail(sig.error());

			auto ok = MessageVerifier().verify(*key, *sig, *message, max_age.value_or(cfg->signing.max_age_ms));
			crypto::secure_wipe(*key);
			if (!ok)
				return fail(ok.error());
			if (!*ok)
			{
				std::cerr << "Signature verification failed" << std::endl;
				return 2;
			}
			std::cout << "Signature valid" << std::endl;
			return 0;
		}

		if (*canon_cmd)
		{
			auto canonical = json::CanonicalEncoder::canonicalize_string(message_text);
			if (!canonical)
				return fail(canonical.error());
			std::cout << *canonical << std::endl;
			return 0;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace aeon::cli
