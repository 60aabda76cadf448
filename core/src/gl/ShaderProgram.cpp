#include "qc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace qc {

ShaderProgram::~ShaderProgram() {
  release();
}

static GLuint compileShader(GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetShaderInfoLog(s, len, nullptr, log.data());
    std::fprintf(stderr, "[ShaderProgram] %s shader compile error:\n%s\n",
                 type == GL_VERTEX_SHADER ? "vertex" : "fragment", log.data());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc) {
  release();

  GLuint vs = compileShader(GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;

  GLuint fs = compileShader(GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) { glDeleteShader(vs); return false; }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);

  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetProgramInfoLog(program_, len, nullptr, log.data());
    std::fprintf(stderr, "[ShaderProgram] link error:\n%s\n", log.data());
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

void ShaderProgram::release() {
  if (program_) {
    glDeleteProgram(program_);
    program_ = 0;
  }
}

} // namespace qc
