#include "presenter.hpp"
#include <sstream>

namespace minawallet {

OutputFormat parse_output_format(const std::string& name) {
    if (name == "json") {
        return OutputFormat::Json;
    }
    return OutputFormat::Text;
}

std::string render_text(const Wallet& wallet) {
    std::ostringstream out;
    out << "Wallet Generated Successfully!\n"
        << "==============================\n"
        << "Address:          " << wallet.address() << "\n"
        << "Secret Key (Hex): " << wallet.secret_key_hex() << "\n"
        << "Secret Key (B58): " << wallet.secret_key_base58() << "\n"
        << "Network:          " << wallet.network() << "\n"
        << "\n"
        << "WARNING: Store your secret key securely! Anyone with access to it can control your funds.\n";
    return out.str();
}

nlohmann::ordered_json render_json(const Wallet& wallet) {
    nlohmann::ordered_json j;
    j["address"] = wallet.address();
    j["secret_key_hex"] = wallet.secret_key_hex();
    j["secret_key_base58"] = wallet.secret_key_base58();
    j["network"] = to_string(wallet.network());
    return j;
}

std::string render_wallet(const Wallet& wallet, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            return render_json(wallet).dump(2) + "\n";
        case OutputFormat::Text:
            break;
    }
    return render_text(wallet);
}

} // namespace minawallet
