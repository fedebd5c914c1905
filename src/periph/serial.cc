#define LOG_MODULE_NAME serial
#include "prelude.hh"
#include "periph/serial.hh"
#include <errno.h>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

using namespace serial;

static bool baud_to_speed(uint32_t baud, speed_t *speed);
static ret_code_t apply_speed(int fd, speed_t speed);

transport::~transport()
{
    if (fd < 0)
        return;

    auto const ret = close();
    if (ret != TAPE_SUCCESS) {
        LOG_WARNING("Close on destruction failed: %s", error_str(ret));
    }
}

ret_code_t transport::open(char const *id, uint32_t baud)
{
    if (!id)
        return TAPE_ERROR_NULL;
    if (fd >= 0)
        return TAPE_ERROR_INVALID_STATE;

    speed_t speed;
    if (!baud_to_speed(baud, &speed)) {
        LOG_ERROR("Unsupported baud rate %u", baud);
        return TAPE_ERROR_INVALID_PARAM;
    }

    auto const new_fd = ::open(id, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (new_fd < 0) {
        LOG_ERROR("open(%s): %s", id, strerror(errno));
        return TAPE_ERROR_IO;
    }

    struct termios tio = {};
    if (tcgetattr(new_fd, &tio) != 0) {
        LOG_ERROR("tcgetattr(%s): %s", id, strerror(errno));
        ::close(new_fd);
        return TAPE_ERROR_IO;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cflag &= ~CSTOPB;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(new_fd, TCSANOW, &tio) != 0) {
        LOG_ERROR("tcsetattr(%s): %s", id, strerror(errno));
        ::close(new_fd);
        return TAPE_ERROR_IO;
    }

    auto const ret = apply_speed(new_fd, speed);
    if (ret != TAPE_SUCCESS) {
        ::close(new_fd);
        return ret;
    }

    fd = new_fd;
    LOG_DEBUG("Opened %s at %u baud", id, baud);

    return TAPE_SUCCESS;
}

ret_code_t transport::write(uint8_t const *data, size_t length)
{
    if (fd < 0)
        return TAPE_ERROR_INVALID_STATE;
    if (length > 0 && !data)
        return TAPE_ERROR_NULL;

    while (length > 0) {
        auto const n = ::write(fd, data, length);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            LOG_ERROR("write: %s", strerror(errno));
            return TAPE_ERROR_IO;
        }

        data += n;
        length -= static_cast<size_t>(n);
    }

    return TAPE_SUCCESS;
}

ret_code_t transport::flush_output()
{
    if (fd < 0)
        return TAPE_ERROR_INVALID_STATE;

    while (tcdrain(fd) != 0) {
        if (errno != EINTR) {
            LOG_ERROR("tcdrain: %s", strerror(errno));
            return TAPE_ERROR_IO;
        }
    }

    return TAPE_SUCCESS;
}

ret_code_t transport::flush_input()
{
    if (fd < 0)
        return TAPE_ERROR_INVALID_STATE;

    if (tcflush(fd, TCIFLUSH) != 0) {
        LOG_ERROR("tcflush: %s", strerror(errno));
        return TAPE_ERROR_IO;
    }

    return TAPE_SUCCESS;
}

ret_code_t transport::set_baud_rate(uint32_t baud)
{
    if (fd < 0)
        return TAPE_ERROR_INVALID_STATE;

    speed_t speed;
    if (!baud_to_speed(baud, &speed)) {
        LOG_ERROR("Unsupported baud rate %u", baud);
        return TAPE_ERROR_INVALID_PARAM;
    }

    return apply_speed(fd, speed);
}

ret_code_t transport::close()
{
    if (fd < 0)
        return TAPE_ERROR_INVALID_STATE;

    auto const old_fd = fd;
    fd = -1;

    /* the descriptor is gone even if close() reports an error */
    if (::close(old_fd) != 0) {
        LOG_ERROR("close: %s", strerror(errno));
        return TAPE_ERROR_IO;
    }

    return TAPE_SUCCESS;
}

static bool baud_to_speed(uint32_t baud, speed_t *speed)
{
    switch (baud) {
    case 1200:   *speed = B1200;   return true;
    case 2400:   *speed = B2400;   return true;
    case 4800:   *speed = B4800;   return true;
    case 9600:   *speed = B9600;   return true;
    case 19200:  *speed = B19200;  return true;
    case 38400:  *speed = B38400;  return true;
    case 57600:  *speed = B57600;  return true;
    case 115200: *speed = B115200; return true;
    }
    return false;
}

static ret_code_t apply_speed(int fd, speed_t speed)
{
    struct termios tio = {};

    if (tcgetattr(fd, &tio) != 0) {
        LOG_ERROR("tcgetattr: %s", strerror(errno));
        return TAPE_ERROR_IO;
    }

    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd, TCSADRAIN, &tio) != 0) {
        LOG_ERROR("tcsetattr: %s", strerror(errno));
        return TAPE_ERROR_IO;
    }

    return TAPE_SUCCESS;
}
