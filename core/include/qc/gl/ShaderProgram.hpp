#pragma once
#include <glad/gl.h>

namespace qc {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (errors go to stderr).
  bool build(const char* vertSrc, const char* fragSrc);

  void use() const;

  // Deletes the GL program. Safe to call more than once.
  void release();

  bool valid() const { return program_ != 0; }
  GLuint id() const { return program_; }

private:
  GLuint program_{0};
};

} // namespace qc
