#ifndef HOLDEM_HTTP_TRANSPORT_HPP
#define HOLDEM_HTTP_TRANSPORT_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace holdem_eval {

struct HttpResponse {
    long        status = 0;
    std::string body;
};

// Échec réseau : résolution DNS, connexion, délai dépassé, etc.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what_arg)
        : std::runtime_error(what_arg) {}
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Client HTTP minimal utilisé par l'oracle de classement.
 *
 * Les implémentations doivent être utilisables depuis plusieurs threads.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief GET bloquant, borné par timeout.
     * @param query Paramètres non encodés ; l'implémentation se charge de l'encodage URL.
     * @throws TransportError si aucune réponse HTTP n'a été obtenue.
     */
    virtual HttpResponse get(const std::string& url,
                             const QueryParams& query,
                             std::chrono::milliseconds timeout) = 0;
};

} // namespace holdem_eval

#endif // HOLDEM_HTTP_TRANSPORT_HPP
