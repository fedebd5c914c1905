#include "prelude.hh"
#include "tape/transcode.hh"

using namespace tape;

ret_code_t transcode::write(pixel const &value)
{
    return output.write(value.bytes, sizeof(value.bytes));
}

ret_code_t transcode::write(color::rgb const &value)
{
    return write(encode(value));
}

ret_code_t transcode::write_show()
{
    return output.write(show_command, sizeof(show_command));
}
