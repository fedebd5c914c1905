#define LOG_MODULE_NAME bootloader
#include "prelude.hh"
#include "tape/session.hh"

using namespace tape;

/**
 * Opening the port at 1200 baud is the same "touch" the Arduino IDE uses
 * to reboot a 32u4 into its bootloader. The device drops off the bus right
 * after, so nothing is read back and the session is closed either way.
 */
ret_code_t session::reset_to_bootloader()
{
    ret_code_t ret;

    ret = check_open();
    TAPE_VERIFY_SUCCESS(ret);

    LOG_INFO("Resetting %s into its bootloader", port_id.c_str());

    ret = tp->set_baud_rate(BAUD_BOOTLOADER);
    if (ret != TAPE_SUCCESS) {
        LOG_ERROR("Baud change on %s failed: %s", port_id.c_str(), error_str(ret));
    }

    auto const close_ret = close();

    return ret != TAPE_SUCCESS ? ret : close_ret;
}
