#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <cipher/Vigenere/DoubleVigenere.hpp>
#include <core/Key.hpp>
#include <core/TransformEngine.hpp>
#include <core/modeFactory.hpp>
#include <mode/StreamMode.hpp>
#include <utils/DataConverter.hpp>
#include <utils/FileIO.hpp>
#include <utils/errors.hpp>

namespace {

void runDemo() {
    const std::string plain = "Master of Puppets, The New Order, Rust In Peace";
    const std::string key1 = "sayaka";

    TransformEngine engine;
    std::string cipherText = engine.encode(plain, key1);
    std::string decrypted = engine.decode(cipherText, key1);

    std::cout << "Plain text: " << plain << "\n";
    std::cout << "Cipher text: " << cipherText << "\n";
    std::cout << "Cipher text (hex): " << DataConverter::BytesToHex(DataConverter::StringToBytes(cipherText)) << "\n";
    std::cout << "Decrypted text: " << decrypted << std::endl;
}

void streamFile(const std::filesystem::path& input, const std::filesystem::path& output,
    const StreamMode& mode, const Cipher& cipher, bool encrypting, bool verbose) {
    std::ifstream reader(input, std::ios::binary);
    if (!reader.is_open())
        throw StreamIOError("Could not open file: " + input.string());

    std::ofstream writer(output, std::ios::binary | std::ios::trunc);
    if (!writer.is_open())
        throw StreamIOError("Could not create file: " + output.string());

    std::size_t n = encrypting ? mode.encryptStream(reader, writer, cipher)
                               : mode.decryptStream(reader, writer, cipher);
    if (verbose)
        std::cerr << "Streamed " << n << " characters to " << output.string() << "\n";
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"duokey - double-keyed Vigenere text transform"};

    std::string text;
    std::string text_encoding = "utf8";
    std::string file;
    std::string output;

    std::string key;
    std::string key2 = Key::kDefaultSecond;

    std::string mode = "shuffle";
    std::string operation = "encrypt";
    std::string output_encoding = "utf8";
    bool verbose = false;

    // Input options
    auto* textOpt = app.add_option("--text,-t", text, "Text to encrypt/decrypt");
    auto* fileOpt = app.add_option("--file,-f", file, "File to encrypt/decrypt")->check(CLI::ExistingFile);
    textOpt->excludes(fileOpt);
    app.add_option("--text-encoding", text_encoding, "Text encoding (utf8, hex)")
        ->check(CLI::IsMember({"utf8", "hex"}));

    // Key options
    app.add_option("--key,-k", key, "First key");
    app.add_option("--key2", key2, "Second key (a fixed public default is used when omitted)");

    // Operation options
    const std::map<std::string, std::string> operations{
        {"encrypt", "encrypt"}, {"e", "encrypt"}, {"decrypt", "decrypt"}, {"d", "decrypt"}};
    app.add_option("--operation,-o", operation, "Operation (encrypt, decrypt)")
        ->transform(CLI::CheckedTransformer(operations, CLI::ignore_case));
    app.add_option("--mode,-m", mode, "Mode (shuffle, stream)")
        ->check(CLI::IsMember({"shuffle", "stream"}));

    // Output options
    app.add_option("--output", output, "Output file when using --file");
    app.add_option("--output-encoding", output_encoding, "Output encoding (utf8, hex)")
        ->check(CLI::IsMember({"utf8", "hex"}));
    app.add_flag("--verbose,-v", verbose, "Report progress on stderr");

    auto* demo = app.add_subcommand("demo", "Encrypt and decrypt a sample sentence");
    app.require_subcommand(0, 1);

    CLI11_PARSE(app, argc, argv);

    try {
        if (demo->parsed()) {
            runDemo();
            return 0;
        }

        if (textOpt->count() == 0 && fileOpt->count() == 0)
            throw std::runtime_error("Either --text or --file is required");
        if (app.count("--key") == 0)
            throw std::runtime_error("--key is required");

        const bool encrypting = operation == "encrypt";
        DoubleVigenere cipher{ Key(key), Key(key2) };
        auto modePtr = ModeFactory::create(mode);

        if (verbose)
            std::cerr << (encrypting ? "Encrypting" : "Decrypting") << " in " << mode << " mode\n";

        if (textOpt->count() > 0) {
            auto data_bytes = DataConverter::Decode(text, text_encoding);
            std::vector<uint8_t> result = encrypting ? modePtr->encrypt(data_bytes, cipher)
                                                     : modePtr->decrypt(data_bytes, cipher);
            std::cout << DataConverter::Encode(result, output_encoding) << std::endl;
            return 0;
        }

        std::filesystem::path input(file);
        std::filesystem::path outPath = output.empty() ? utils::defaultOutputPath(input, encrypting)
                                                       : std::filesystem::path(output);

        auto* stream = dynamic_cast<StreamMode*>(modePtr.get());
        if (stream) {
            utils::requireDistinctPaths(input, outPath);
            streamFile(input, outPath, *stream, cipher, encrypting, verbose);
        } else {
            // the interleave needs the whole buffer
            auto data_bytes = utils::readFile(input);
            std::vector<uint8_t> result = encrypting ? modePtr->encrypt(data_bytes, cipher)
                                                     : modePtr->decrypt(data_bytes, cipher);
            utils::writeFile(outPath, result);
            if (verbose)
                std::cerr << "Wrote " << result.size() << " characters to " << outPath.string() << "\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
