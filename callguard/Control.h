#ifndef GUARD_CALLGUARD_CONTROL_H
#define GUARD_CALLGUARD_CONTROL_H

#include <memory>
#include <string>

class KeyManager;
class SessionManager;

/** Install the signing key from a PEM file. */
bool loadSigningKey(const std::string &path);
/** Install a fresh random signing key. */
void generateSigningKey();
/** Key manager signing with whatever key is installed. */
std::shared_ptr<KeyManager> getKeyManager();
void startControlSocket(std::shared_ptr<SessionManager> sessions);

#endif // GUARD_CALLGUARD_CONTROL_H
