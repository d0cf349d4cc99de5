#include <jni.h>
#include <stdexcept>
#include <string>
#include "cnpj/cnpj.h"

// Cache class and method IDs for performance
static struct {
    jclass validationResultClass;
    jmethodID validationResultConstructor;
} g_cache;

// Get JNI environment for current thread
static JNIEnv* getEnv(JavaVM* jvm) {
    JNIEnv* env = nullptr;
    jvm->GetEnv(reinterpret_cast<void**>(&env), JNI_VERSION_1_6);
    return env;
}

// Copy a Java string into a std::string (null maps to empty)
static std::string toStdString(JNIEnv* env, jstring value) {
    if (!value) {
        return std::string();
    }
    const char* chars = env->GetStringUTFChars(value, nullptr);
    if (!chars) {
        return std::string();
    }
    std::string result(chars);
    env->ReleaseStringUTFChars(value, chars);
    return result;
}

extern "C" {

JNIEXPORT jint JNI_OnLoad(JavaVM* vm, void* /*reserved*/) {
    JNIEnv* env;
    if (vm->GetEnv(reinterpret_cast<void**>(&env), JNI_VERSION_1_6) != JNI_OK) {
        return JNI_ERR;
    }

    // Cache ValidationResult(valid, errorCode, message, normalized)
    jclass localClass = env->FindClass("com/cnpj/ValidationResult");
    if (!localClass) {
        return JNI_ERR;
    }
    g_cache.validationResultClass = reinterpret_cast<jclass>(env->NewGlobalRef(localClass));
    g_cache.validationResultConstructor = env->GetMethodID(
        g_cache.validationResultClass, "<init>",
        "(ZILjava/lang/String;Ljava/lang/String;)V");
    env->DeleteLocalRef(localClass);

    return JNI_VERSION_1_6;
}

JNIEXPORT void JNI_OnUnload(JavaVM* vm, void* /*reserved*/) {
    JNIEnv* env = getEnv(vm);
    if (env) {
        env->DeleteGlobalRef(g_cache.validationResultClass);
    }
}

JNIEXPORT jstring JNICALL
Java_com_cnpj_CnpjCodec_00024Companion_getVersion(JNIEnv* env, jobject /*thiz*/) {
    return env->NewStringUTF(cnpj::VERSION);
}

JNIEXPORT jboolean JNICALL
Java_com_cnpj_CnpjCodec_nativeValidate(JNIEnv* env, jobject /*thiz*/, jstring candidate) {
    if (!candidate) return JNI_FALSE;
    return cnpj::validate(toStdString(env, candidate)) ? JNI_TRUE : JNI_FALSE;
}

JNIEXPORT jobject JNICALL
Java_com_cnpj_CnpjCodec_nativeValidateDetailed(JNIEnv* env, jobject /*thiz*/, jstring candidate) {
    auto result = cnpj::validateDetailed(toStdString(env, candidate));

    jstring message = env->NewStringUTF(result.message.c_str());
    jstring normalized = env->NewStringUTF(result.normalized.c_str());

    jobject validationResult = env->NewObject(
        g_cache.validationResultClass,
        g_cache.validationResultConstructor,
        static_cast<jboolean>(result.valid),
        static_cast<jint>(result.error),
        message,
        normalized
    );

    env->DeleteLocalRef(message);
    env->DeleteLocalRef(normalized);

    return validationResult;
}

JNIEXPORT jstring JNICALL
Java_com_cnpj_CnpjCodec_nativeComputeCheckDigits(JNIEnv* env, jobject /*thiz*/, jstring body) {
    if (!body) return nullptr;

    auto dv = cnpj::computeCheckDigits(toStdString(env, body));
    if (!dv.success) return nullptr;
    return env->NewStringUTF(dv.digits.toString().c_str());
}

JNIEXPORT jstring JNICALL
Java_com_cnpj_CnpjCodec_nativeFormat(JNIEnv* env, jobject /*thiz*/, jstring value) {
    if (!value) return nullptr;

    try {
        std::string masked = cnpj::utils::applyMask(toStdString(env, value));
        return env->NewStringUTF(masked.c_str());
    } catch (const std::invalid_argument&) {
        return nullptr;
    }
}

JNIEXPORT jstring JNICALL
Java_com_cnpj_CnpjCodec_nativeGenerate(JNIEnv* env, jobject /*thiz*/, jboolean alphanumeric) {
    return env->NewStringUTF(cnpj::generate(alphanumeric == JNI_TRUE).c_str());
}

JNIEXPORT jlong JNICALL
Java_com_cnpj_CnpjCodec_nativeCreateGenerator(
    JNIEnv* /*env*/, jobject /*thiz*/, jboolean alphanumeric, jint seed
) {
    cnpj::GeneratorConfig config;
    config.alphanumeric = alphanumeric == JNI_TRUE;
    config.seed = static_cast<uint32_t>(seed);

    auto* generator = new cnpj::Generator(config);
    return reinterpret_cast<jlong>(generator);
}

JNIEXPORT void JNICALL
Java_com_cnpj_CnpjCodec_nativeDestroyGenerator(JNIEnv* /*env*/, jobject /*thiz*/, jlong handle) {
    delete reinterpret_cast<cnpj::Generator*>(handle);
}

JNIEXPORT jstring JNICALL
Java_com_cnpj_CnpjCodec_nativeNext(JNIEnv* env, jobject /*thiz*/, jlong handle) {
    auto* generator = reinterpret_cast<cnpj::Generator*>(handle);
    if (!generator) return nullptr;
    return env->NewStringUTF(generator->generate().c_str());
}

} // extern "C"
